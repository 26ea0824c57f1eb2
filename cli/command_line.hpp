#pragma once
#include <iostream>
#include <string>
#include <vector>

// "generate" and "compare" subcommands. Returns the process exit code.
class CommandLine {
public:
    CommandLine(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args);

    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILED = 1;
    static constexpr int EXIT_USAGE = 2;

private:
    std::ostream& out_;
    std::ostream& err_;

    int handleGenerate(const std::vector<std::string>& args);
    int handleCompare(const std::vector<std::string>& args);
    void printHelp(std::ostream& os) const;
};
