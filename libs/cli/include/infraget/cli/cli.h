#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>

namespace infraget
{
    /**
     * Run the infraget command line with the given arguments (without the
     * program name). JSON results are written to `out`.
     * @return The process exit code: 0 on success, 1 if the command failed,
     *  or the CLI11 exit code for invalid arguments.
     */
    int runFromCommandLine(std::vector<std::string> args, bool requireSubcommand = true, std::ostream& out = std::cout);
}
