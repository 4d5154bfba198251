#include "util/string_utils.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

std::string trim(const std::string& input) {
    int inputSize = input.size();

    int start = 0;
    while (start < inputSize && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }

    int end = inputSize - 1;
    while (end >= 0 && std::isspace(static_cast<unsigned char>(input[end]))) {
        --end;
    }

    if (end < start) {
        return "";
    }

    int outputLength = end - start + 1;
    return input.substr(start, outputLength);
}

std::string toLower(const std::string& input) {
    std::string output = input;
    for (char& c : output) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return output;
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::optional<std::vector<std::string>> splitCommandLine(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    bool isInToken = false;
    bool isInQuotes = false;

    for (char c : input) {
        if (c == '"') {
            isInQuotes = !isInQuotes;
            isInToken = true;
        }
        else if (!isInQuotes && std::isspace(static_cast<unsigned char>(c))) {
            if (isInToken) {
                tokens.push_back(current);
                current.clear();
                isInToken = false;
            }
        }
        else {
            current += c;
            isInToken = true;
        }
    }

    if (isInQuotes) {
        return std::nullopt;
    }
    if (isInToken) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<int> parseInt(const std::string& input) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(input, &consumed);
        if (consumed != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parseUnsigned(const std::string& input) {
    if (input.empty() || !std::isdigit(static_cast<unsigned char>(input[0]))) {
        return std::nullopt;
    }

    try {
        std::size_t consumed = 0;
        unsigned long long value = std::stoull(input, &consumed);
        if (consumed != input.size()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& input) {
    try {
        std::size_t consumed = 0;
        double value = std::stod(input, &consumed);
        if (consumed != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatFixedPoint(double num, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << num;
    return ss.str();
}
