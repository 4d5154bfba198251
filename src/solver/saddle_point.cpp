#include "solver/saddle_point.hpp"

#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <string>

std::string getStartPolicyName(StartPolicy policy) {
    switch (policy) {
        case StartPolicy::Midpoint:
            return "midpoint";
        case StartPolicy::Explicit:
            return "explicit";
        case StartPolicy::Random:
            return "random";
        default:
            assert(false);
            return "";
    }
}

Result<StartPolicy> getStartPolicyFromName(const std::string& name) {
    std::string lowered = toLower(trim(name));
    if (lowered == "midpoint") {
        return StartPolicy::Midpoint;
    }
    if (lowered == "explicit") {
        return StartPolicy::Explicit;
    }
    if (lowered == "random") {
        return StartPolicy::Random;
    }
    return "Unknown start policy \"" + name + "\". Expected \"midpoint\", \"explicit\" or \"random\".";
}
