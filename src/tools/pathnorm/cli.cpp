//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the pathnorm driver.  Arguments are decoded into CliOptions,
// options are resolved through the manifest/environment/flag layers, and every
// input path is normalized and written to the output stream.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command-line parsing and execution for the pathnorm tool.
/// @details Streams and the environment are injected so tests can drive the
///          complete workflow without spawning a process.

#include "tools/pathnorm/cli.hpp"

#include "core/FolderPath.hpp"
#include "core/OptionNames.hpp"

#include <string_view>

namespace pathnorm::tools
{
namespace
{

using support::Expected;

constexpr const char *kToolName = "pathnorm";

/// @brief Fetch the value following flag @p flag, advancing @p index.
Expected<std::string> takeValue(int &index, int argc, char **argv, std::string_view flag)
{
    if (index + 1 >= argc)
        return support::makeError(kToolName, "missing value for " + std::string(flag));
    return std::string(argv[++index]);
}

/// @brief Parse the value of an option flag with @p parse.
template <class T, class Parser>
Expected<void> parseFlagValue(
    int &index, int argc, char **argv, std::string_view flag, Parser parse, std::optional<T> &slot)
{
    auto value = takeValue(index, argc, argv, flag);
    if (!value)
        return value.error();
    auto parsed = parse(value.value());
    if (!parsed)
        return support::makeError(kToolName,
                                  "invalid value '" + value.value() + "' for " + std::string(flag));
    slot = *parsed;
    return {};
}

void printTrace(std::ostream &err, std::string_view input, const NormalizationTrace &trace)
{
    err << "trace: input \"" << input << "\"\n";
    for (const auto &record : trace.records)
    {
        err << "trace: pass " << record.pass << ' ' << toString(record.stage) << ": \""
            << record.text << "\"\n";
    }
}

} // namespace

Expected<CliOptions> parseArgs(int argc, char **argv)
{
    CliOptions opts;
    bool positionalOnly = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (positionalOnly || arg.empty() || arg[0] != '-' || arg == "-")
        {
            opts.paths.push_back(arg);
            continue;
        }

        Expected<void> parsed;
        if (arg == "--")
        {
            positionalOnly = true;
        }
        else if (arg == "--root")
        {
            parsed = parseFlagValue(i, argc, argv, arg, parseFolderRoot, opts.overrides.root);
        }
        else if (arg == "--slashes")
        {
            parsed = parseFlagValue(i, argc, argv, arg, parseSlashType, opts.overrides.slashes);
        }
        else if (arg == "--leading")
        {
            parsed = parseFlagValue(i, argc, argv, arg, parseSlashRequirement, opts.overrides.leading);
        }
        else if (arg == "--trailing")
        {
            parsed = parseFlagValue(i, argc, argv, arg, parseSlashRequirement, opts.overrides.trailing);
        }
        else if (arg == "--config")
        {
            auto value = takeValue(i, argc, argv, arg);
            if (!value)
                return value.error();
            opts.configPath = value.value();
        }
        else if (arg == "--trace")
        {
            opts.trace = true;
        }
        else if (arg == "--check")
        {
            opts.check = true;
        }
        else if (arg == "--show-config")
        {
            opts.showConfig = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            opts.help = true;
        }
        else if (arg == "--version")
        {
            opts.version = true;
        }
        else
        {
            return support::makeError(kToolName, "unknown option '" + arg + "'");
        }

        if (!parsed)
            return parsed.error();
    }
    return opts;
}

int runCLI(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err, const EnvLookup &env)
{
    auto parsed = parseArgs(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        err << "Try 'pathnorm --help' for more information.\n";
        return kExitUsage;
    }
    const CliOptions &cli = parsed.value();

    if (cli.help)
    {
        printUsage(out);
        return kExitOk;
    }
    if (cli.version)
    {
        printVersion(out);
        return kExitOk;
    }

    support::DiagnosticEngine diags;
    auto resolved = resolveOptions(cli.overrides, cli.configPath, env, diags);
    diags.printAll(err);
    if (!resolved)
    {
        support::printDiag(resolved.error(), err);
        return kExitFailure;
    }
    const PathNormalizer normalizer(resolved.value());

    if (cli.showConfig)
    {
        out << describe(normalizer.options()) << '\n';
        return kExitOk;
    }

    bool unstable = false;
    auto process = [&](std::string_view input) {
        NormalizationTrace trace;
        std::string result = normalizer.normalize(input, cli.trace ? &trace : nullptr);
        if (cli.trace)
            printTrace(err, input, trace);
        if (!cli.check)
        {
            out << result << '\n';
            return;
        }
        if (result != input)
        {
            unstable = true;
            out << input << " -> " << result << '\n';
        }
    };

    if (!cli.paths.empty())
    {
        for (const auto &path : cli.paths)
            process(path);
    }
    else
    {
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            process(line);
        }
    }

    return unstable ? kExitFailure : kExitOk;
}

} // namespace pathnorm::tools
