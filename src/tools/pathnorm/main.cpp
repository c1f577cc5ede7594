//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the pathnorm command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `pathnorm` CLI tool.
/// @details Binds the driver to the process streams and environment.

#include "tools/pathnorm/cli.hpp"

#include <iostream>

/// @brief Main entry point for the pathnorm CLI.
/// @param argc Number of command-line arguments in @p argv.
/// @param argv Argument vector passed to the process.
/// @return Exit status propagated from the driver.
int main(int argc, char **argv)
{
    return pathnorm::tools::runCLI(
        argc, argv, std::cin, std::cout, std::cerr, pathnorm::tools::processEnvironment());
}
