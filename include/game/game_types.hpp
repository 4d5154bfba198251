#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include <array>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

enum class Player : std::uint8_t {
    Row,
    Column
};

template <typename T>
class PlayerArray {
public:
    constexpr PlayerArray() = default;
    constexpr PlayerArray(const T& rowValue, const T& columnValue) : m_array{ rowValue, columnValue } {};

    constexpr const T& operator[](Player player) const {
        return m_array[getPlayerIndex(player)];
    }

    constexpr T& operator[](Player player) {
        return m_array[getPlayerIndex(player)];
    }

    constexpr bool operator==(const PlayerArray&) const = default;

private:
    constexpr int getPlayerIndex(Player player) const {
        int playerIndex = static_cast<int>(player);
        assert(playerIndex == 0 || playerIndex == 1);
        return playerIndex;
    }

    std::array<T, 2> m_array;
};

// Rows are the row player's pure strategies, entries are the row player's payoff
template <typename T>
using PayoffMatrix = std::vector<std::vector<T>>;

// Probabilities indexed by pure strategy
template <typename T>
using MixedStrategy = std::vector<T>;

template <typename T>
struct Interval {
    T lower;
    T upper;

    bool operator==(const Interval&) const = default;
};

template <typename T>
struct Point {
    T x;
    T y;

    bool operator==(const Point&) const = default;
};

#endif // GAME_TYPES_HPP
