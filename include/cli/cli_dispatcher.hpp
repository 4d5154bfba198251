#ifndef CLI_DISPATCHER_HPP
#define CLI_DISPATCHER_HPP

#include <functional>
#include <istream>
#include <map>
#include <string>
#include <vector>

using HandlerWithoutArgument = std::function<bool()>;
using HandlerWithArgument = std::function<bool(const std::string&)>;

struct Version {
    int major;
    int minor;
    int patch;
};

// Line-oriented command interpreter. Arguments containing spaces can be quoted: load "my games.yml"
class CliDispatcher {
public:
    CliDispatcher(const std::string& programName, const Version& version);

    bool registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler);
    bool registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler);

    // Reads commands until "exit" or the end of the input and returns the number of failed commands.
    // Interactive mode prints a banner and a prompt, script mode echoes every command instead.
    // Blank lines and lines starting with '#' are skipped.
    int run(std::istream& input, bool isInteractive);
    int run();

    // Runs one line of input, returns false if the command failed or does not exist
    bool executeCommand(const std::string& userInput);

private:
    bool isCommandNameValid(const std::string& name) const;
    std::string getUsage(const std::string& name) const;
    bool handleHelp() const;
    bool handleExit();

    std::string m_programName;
    Version m_version;
    bool m_isRunning;
    std::vector<std::string> m_commandOrder;
    std::map<std::string, std::string> m_commandDescriptions;
    std::map<std::string, std::string> m_commandArguments;
    std::map<std::string, HandlerWithoutArgument> m_handlersWithoutArguments;
    std::map<std::string, HandlerWithArgument> m_handlersWithArguments;
};

#endif // CLI_DISPATCHER_HPP
