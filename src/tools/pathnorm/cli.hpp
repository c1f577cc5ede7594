// File: src/tools/pathnorm/cli.hpp
// Purpose: Declarations for pathnorm argument parsing and the CLI driver.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: src/tools/pathnorm/cli.cpp

#pragma once

#include "support/diag_expected.hpp"
#include "tools/pathnorm/config_loader.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pathnorm::tools
{

/// @brief Exit statuses returned by runCLI().
enum ExitCode : int
{
    kExitOk = 0,       ///< All inputs processed (and stable under --check).
    kExitFailure = 1,  ///< Unstable input under --check or configuration error.
    kExitUsage = 2,    ///< Malformed command line.
};

/// @brief Options collected from the command line.
struct CliOptions
{
    /// @brief Normalizer overrides from --root, --slashes, --leading, --trailing.
    OptionOverrides overrides{};

    /// @brief Manifest requested via --config.
    std::optional<std::string> configPath{};

    /// @brief Write every normalization stage to the error stream.
    bool trace = false;

    /// @brief Report inputs that are not already normalized instead of printing results.
    bool check = false;

    /// @brief Print the resolved configuration and exit.
    bool showConfig = false;

    bool help = false;
    bool version = false;

    /// @brief Paths given as positional arguments; stdin is read when empty.
    std::vector<std::string> paths{};
};

/// @brief Parse pathnorm arguments.
/// @param argc Number of entries in @p argv, including the program name.
/// @param argv Argument vector.
/// @return Parsed options or a diagnostic describing the first bad argument.
support::Expected<CliOptions> parseArgs(int argc, char **argv);

/// @brief Execute the pathnorm CLI workflow with injectable streams and environment.
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector containing the program name first.
/// @param in Stream providing paths when none are given as arguments.
/// @param out Stream receiving normalized paths.
/// @param err Stream receiving diagnostics and trace output.
/// @param env Environment lookup used for PATHNORM_* variables.
/// @return One of the ExitCode values.
int runCLI(int argc,
           char **argv,
           std::istream &in,
           std::ostream &out,
           std::ostream &err,
           const EnvLookup &env);

/// @brief Print usage information for pathnorm to @p os.
void printUsage(std::ostream &os);

/// @brief Print the pathnorm version banner to @p os.
void printVersion(std::ostream &os);

} // namespace pathnorm::tools
