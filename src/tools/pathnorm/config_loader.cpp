//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pathnorm/config_loader.cpp
// Purpose: Implements manifest parsing and layered option resolution for the
//          pathnorm tool.
// Key invariants: Manifest errors carry "path:line" context; environment
//                 problems only ever produce warnings.
// Ownership/Lifetime: Returned values are owned by the caller.
//
//===----------------------------------------------------------------------===//

#include "tools/pathnorm/config_loader.hpp"

#include "core/OptionNames.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pathnorm::tools
{
namespace
{

using support::Diag;
using support::Expected;

/// @brief Make a diagnostic error with file:line context.
Diag makeManifestErr(const std::string &origin, int line, const std::string &msg)
{
    return support::makeError(origin + ":" + std::to_string(line), msg);
}

/// @brief Join the canonical names of @p values as "a, b, or c".
template <class Values> std::string expectedNames(const Values &values)
{
    std::ostringstream os;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i != 0)
            os << (i + 1 == values.size() ? ", or " : ", ");
        os << '\'' << toString(values[i]) << '\'';
    }
    return os.str();
}

/// @brief Store @p parsed into @p slot, rejecting duplicates and unknown names.
template <class T>
Expected<void> assign(std::optional<T> &slot,
                      std::optional<T> parsed,
                      const std::string &directive,
                      const std::string &value,
                      const std::string &accepted,
                      const std::string &origin,
                      int lineNum)
{
    if (slot)
        return makeManifestErr(origin, lineNum, "duplicate directive '" + directive + "'");
    if (!parsed)
        return makeManifestErr(
            origin, lineNum, "invalid " + directive + " '" + value + "'; expected " + accepted);
    slot = parsed;
    return {};
}

} // namespace

EnvLookup processEnvironment()
{
    return [](const char *name) -> const char * { return std::getenv(name); };
}

void applyOverrides(FolderPathOptions &options, const OptionOverrides &overrides)
{
    if (overrides.root)
        options.root = *overrides.root;
    if (overrides.slashes)
        options.slashes = *overrides.slashes;
    if (overrides.leading)
        options.leading = *overrides.leading;
    if (overrides.trailing)
        options.trailing = *overrides.trailing;
}

Expected<OptionOverrides> parseManifest(std::istream &in, const std::string &origin)
{
    OptionOverrides overrides;

    std::string line;
    int lineNum = 0;
    while (std::getline(in, line))
    {
        ++lineNum;

        // Strip leading/trailing whitespace
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos)
            continue; // blank line
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        // Skip comments
        if (line.empty() || line[0] == '#')
            continue;

        auto spacePos = line.find_first_of(" \t");
        if (spacePos == std::string::npos)
            return makeManifestErr(origin, lineNum, "directive missing value: '" + line + "'");

        std::string directive = line.substr(0, spacePos);
        std::string value = line.substr(line.find_first_not_of(" \t\r\n", spacePos));

        Expected<void> stored;
        if (directive == "root")
        {
            stored = assign(overrides.root, parseFolderRoot(value), directive, value,
                            expectedNames(kAllFolderRoots), origin, lineNum);
        }
        else if (directive == "slashes")
        {
            stored = assign(overrides.slashes, parseSlashType(value), directive, value,
                            expectedNames(kAllSlashTypes), origin, lineNum);
        }
        else if (directive == "leading")
        {
            stored = assign(overrides.leading, parseSlashRequirement(value), directive, value,
                            expectedNames(kAllSlashRequirements), origin, lineNum);
        }
        else if (directive == "trailing")
        {
            stored = assign(overrides.trailing, parseSlashRequirement(value), directive, value,
                            expectedNames(kAllSlashRequirements), origin, lineNum);
        }
        else
        {
            return makeManifestErr(origin, lineNum, "unknown directive '" + directive + "'");
        }

        if (!stored)
            return stored.error();
    }

    return overrides;
}

Expected<OptionOverrides> loadManifest(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return support::makeError({}, "cannot open config: " + path);
    return parseManifest(file, path);
}

OptionOverrides readEnvironment(const EnvLookup &env, support::DiagnosticEngine &diags)
{
    OptionOverrides overrides;

    auto read = [&](const char *name, auto parse, auto &slot) {
        const char *raw = env ? env(name) : nullptr;
        if (raw == nullptr || *raw == '\0')
            return;
        if (auto parsed = parse(raw))
        {
            slot = *parsed;
            return;
        }
        diags.report(support::makeWarning(
            "pathnorm", std::string("ignoring ") + name + "='" + raw + "': unrecognised value"));
    };

    read("PATHNORM_ROOT", parseFolderRoot, overrides.root);
    read("PATHNORM_SLASHES", parseSlashType, overrides.slashes);
    read("PATHNORM_LEADING", parseSlashRequirement, overrides.leading);
    read("PATHNORM_TRAILING", parseSlashRequirement, overrides.trailing);
    return overrides;
}

Expected<FolderPathOptions> resolveOptions(const OptionOverrides &flags,
                                           const std::optional<std::string> &configPath,
                                           const EnvLookup &env,
                                           support::DiagnosticEngine &diags)
{
    FolderPathOptions options;

    std::optional<std::string> manifest = configPath;
    if (!manifest && env)
    {
        const char *fromEnv = env("PATHNORM_CONFIG");
        if (fromEnv != nullptr && *fromEnv != '\0')
            manifest = std::string(fromEnv);
    }
    if (manifest)
    {
        auto loaded = loadManifest(*manifest);
        if (!loaded)
            return loaded.error();
        applyOverrides(options, loaded.value());
    }

    applyOverrides(options, readEnvironment(env, diags));
    applyOverrides(options, flags);
    return options;
}

} // namespace pathnorm::tools
