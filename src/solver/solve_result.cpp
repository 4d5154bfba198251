#include "solver/solve_result.hpp"

#include <cassert>
#include <string>

std::string getTerminationReasonName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Converged:
            return "converged";
        case TerminationReason::MaxIterationsExceeded:
            return "max-iterations-exceeded";
        case TerminationReason::NumericFailure:
            return "numeric-failure";
        default:
            assert(false);
            return "";
    }
}
