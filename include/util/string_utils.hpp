#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string toLower(const std::string& input);
std::string join(const std::vector<std::string>& inputs, const std::string& connector);

// Splits on whitespace. Double quotes group words into one token and are removed.
// Returns std::nullopt if a quote is left open.
std::optional<std::vector<std::string>> splitCommandLine(const std::string& input);

std::optional<int> parseInt(const std::string& input);
std::optional<std::uint64_t> parseUnsigned(const std::string& input);
std::optional<double> parseDouble(const std::string& input);
std::string formatFixedPoint(double num, int precision);

#endif // STRING_UTILS_HPP
