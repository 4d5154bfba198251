#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c)) || c == '"' || c == '#') {
            return false;
        }
    }

    return m_commandDescriptions.find(name) == m_commandDescriptions.end();
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_handlersWithoutArguments.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, argument });
    m_handlersWithArguments.insert({ name, handler });
    return true;
}

int CliDispatcher::run(std::istream& input, bool isInteractive) {
    m_isRunning = true;
    int numFailures = 0;

    if (isInteractive) {
        std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
        std::cout << "Type \"help\" for more information.\n";
    }

    while (m_isRunning) {
        if (isInteractive) {
            std::cout << "> ";
        }

        std::string userInput;
        if (!std::getline(input, userInput)) {
            if (isInteractive) {
                std::cout << "\n";
            }
            m_isRunning = false;
            break;
        }

        std::string command = trim(userInput);
        if (command.empty() || command[0] == '#') {
            continue;
        }

        if (!isInteractive) {
            std::cout << "> " << command << "\n";
        }

        if (!executeCommand(command)) {
            ++numFailures;
        }
    }

    return numFailures;
}

int CliDispatcher::run() {
    return run(std::cin, true);
}

bool CliDispatcher::executeCommand(const std::string& userInput) {
    std::optional<std::vector<std::string>> tokensOption = splitCommandLine(userInput);
    if (!tokensOption) {
        std::cerr << "Error: Unterminated quote in \"" << userInput << "\"\n";
        return false;
    }

    const std::vector<std::string>& tokens = *tokensOption;
    if (tokens.empty()) {
        return false;
    }

    const std::string& commandName = tokens[0];
    int numArguments = static_cast<int>(tokens.size()) - 1;

    auto printArgumentError = [this, &commandName, numArguments](int expected) {
        std::cerr << "Error: Incorrect number of arguments provided for " << commandName << ": Expected " << expected
            << ", got " << numArguments << ". Usage: " << getUsage(commandName) << "\n";
    };

    auto handlerWithoutArgument = m_handlersWithoutArguments.find(commandName);
    if (handlerWithoutArgument != m_handlersWithoutArguments.end()) {
        if (numArguments != 0) {
            printArgumentError(0);
            return false;
        }
        return handlerWithoutArgument->second();
    }

    auto handlerWithArgument = m_handlersWithArguments.find(commandName);
    if (handlerWithArgument != m_handlersWithArguments.end()) {
        if (numArguments != 1) {
            printArgumentError(1);
            return false;
        }
        return handlerWithArgument->second(tokens[1]);
    }

    std::cerr << "Error: Unknown command: " << commandName << ". Type \"help\" for a list of commands.\n";
    return false;
}

std::string CliDispatcher::getUsage(const std::string& name) const {
    auto argument = m_commandArguments.find(name);
    if (argument == m_commandArguments.end()) {
        return name;
    }
    return name + " <" + argument->second + ">";
}

bool CliDispatcher::handleHelp() const {
    std::size_t usageWidth = 0;
    for (const std::string& name : m_commandOrder) {
        usageWidth = std::max(usageWidth, getUsage(name).size());
    }

    std::cout << m_programName << " commands:\n";
    for (const std::string& name : m_commandOrder) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(usageWidth)) << getUsage(name)
            << "  " << m_commandDescriptions.at(name) << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
