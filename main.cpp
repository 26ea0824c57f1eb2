#include "cli/command_line.hpp"

int main(int argc, char** argv) {
    CommandLine cli;
    return cli.run(argc, argv);
}
