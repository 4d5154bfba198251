#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "numeric/field.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Player functions
Player getOpposingPlayer(Player player);
std::string getPlayerName(Player player);

// NumericKind functions
std::string getNumericKindName(NumericKind kind);
Result<NumericKind> getNumericKindFromName(const std::string& name);

// Strategy functions
template <NumericField T>
bool isMixedStrategy(const MixedStrategy<T>& strategy, std::size_t numStrategies, const T& tolerance) {
    if (strategy.size() != numStrategies) {
        return false;
    }

    T total = FieldTraits<T>::zero();
    for (const T& probability : strategy) {
        if (probability < FieldTraits<T>::zero()) {
            return false;
        }
        total = total + probability;
    }

    T difference = total - FieldTraits<T>::one();
    return !(tolerance < absoluteValue(difference));
}

template <NumericField T>
MixedStrategy<T> getFrequencyStrategy(const std::vector<std::size_t>& counts, std::size_t total) {
    assert(total > 0);

    T denominator = FieldTraits<T>::fromInteger(static_cast<std::int64_t>(total));
    MixedStrategy<T> strategy;
    strategy.reserve(counts.size());
    for (std::size_t count : counts) {
        strategy.push_back(divide(FieldTraits<T>::fromInteger(static_cast<std::int64_t>(count)), denominator));
    }
    return strategy;
}

template <NumericField T>
MixedStrategy<T> getPureStrategy(std::size_t index, std::size_t numStrategies) {
    assert(index < numStrategies);

    MixedStrategy<T> strategy(numStrategies, FieldTraits<T>::zero());
    strategy[index] = FieldTraits<T>::one();
    return strategy;
}

#endif // GAME_UTILS_HPP
