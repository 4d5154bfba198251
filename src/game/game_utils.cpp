#include "game/game_utils.hpp"

#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <string>

Player getOpposingPlayer(Player player) {
    assert(player == Player::Row || player == Player::Column);
    return (player == Player::Row) ? Player::Column : Player::Row;
}

std::string getPlayerName(Player player) {
    switch (player) {
        case Player::Row:
            return "row";
        case Player::Column:
            return "column";
        default:
            assert(false);
            return "";
    }
}

std::string getNumericKindName(NumericKind kind) {
    switch (kind) {
        case NumericKind::Rational:
            return "rational";
        case NumericKind::Float:
            return "float";
        default:
            assert(false);
            return "";
    }
}

Result<NumericKind> getNumericKindFromName(const std::string& name) {
    std::string lowered = toLower(trim(name));
    if (lowered == "rational") {
        return NumericKind::Rational;
    }
    if (lowered == "float") {
        return NumericKind::Float;
    }
    return "Unknown numeric representation \"" + name + "\". Expected \"rational\" or \"float\".";
}
