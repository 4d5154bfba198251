#include "solver/brown_robinson.hpp"

#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <string>

std::string getTieBreakName(TieBreak tieBreak) {
    switch (tieBreak) {
        case TieBreak::SmallestIndex:
            return "smallest-index";
        case TieBreak::Random:
            return "random";
        default:
            assert(false);
            return "";
    }
}

Result<TieBreak> getTieBreakFromName(const std::string& name) {
    std::string lowered = toLower(trim(name));
    if (lowered == "smallest-index") {
        return TieBreak::SmallestIndex;
    }
    if (lowered == "random") {
        return TieBreak::Random;
    }
    return "Unknown tie-break policy \"" + name + "\". Expected \"smallest-index\" or \"random\".";
}
