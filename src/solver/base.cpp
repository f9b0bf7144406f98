#include "solver/base.hpp"

using namespace std;

SolveResult BaseSolver::success(const vector<Push>& pushes) const {
    SolveResult result;
    result.success = true;
    result.pushes = pushes;
    for (const Push& push : pushes) result.solution += dir_to_str(push.dir);
    result.states_explored = states_explored;
    result.time_elapsed = elapsed();
    result.optimal = true;
    return result;
}

SolveResult BaseSolver::failure(FailureReason reason, const string& error) const {
    SolveResult result;
    result.success = false;
    result.reason = reason;
    result.error = error;
    result.states_explored = states_explored;
    result.time_elapsed = elapsed();
    return result;
}
