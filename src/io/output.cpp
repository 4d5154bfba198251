#include "io/output.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>

json buildJSONGameError(const std::string& name, const std::string& error) {
    json j;
    j["Name"] = name;
    j["Error"] = error;
    return j;
}

bool outputJSONToFile(const json& j, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return false;
    }

    // Invalid UTF-8 in user supplied names is replaced rather than rejected
    try {
        file << j.dump(4, ' ', false, json::error_handler_t::replace) << std::endl;
    }
    catch (const json::exception& e) {
        std::cerr << "Error: Could not serialize results: " << e.what() << "\n";
        return false;
    }
    return file.good();
}
