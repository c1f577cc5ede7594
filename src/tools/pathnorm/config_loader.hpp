//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pathnorm/config_loader.hpp
// Purpose: Resolve normalizer options from a pathnorm.config manifest, the
//          environment and command-line overrides.
// Key invariants: Precedence is defaults < manifest < environment < flags;
//                 an unset override never replaces a lower-precedence value.
// Ownership/Lifetime: Caller owns the returned options.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/FolderPath.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace pathnorm::tools
{

/// @brief Partially specified options from one configuration source.
struct OptionOverrides
{
    std::optional<FolderRoot> root;
    std::optional<SlashType> slashes;
    std::optional<SlashRequirement> leading;
    std::optional<SlashRequirement> trailing;
};

/// @brief Environment lookup returning null for unset variables.
using EnvLookup = std::function<const char *(const char *)>;

/// @brief Default lookup backed by std::getenv.
EnvLookup processEnvironment();

/// @brief Copy every set field of @p overrides into @p options.
void applyOverrides(FolderPathOptions &options, const OptionOverrides &overrides);

/// @brief Parse manifest text read from @p in.
///
/// One `directive value` pair per line; blank lines and `#` comments are
/// ignored.  Recognised directives: root, slashes, leading, trailing.
///
/// @param in Stream positioned at the start of the manifest.
/// @param origin Name used in diagnostics (usually the file path).
/// @return Parsed overrides, or a diagnostic prefixed with "origin:line".
support::Expected<OptionOverrides> parseManifest(std::istream &in, const std::string &origin);

/// @brief Open and parse the manifest at @p path.
support::Expected<OptionOverrides> loadManifest(const std::string &path);

/// @brief Read PATHNORM_ROOT, PATHNORM_SLASHES, PATHNORM_LEADING and PATHNORM_TRAILING.
/// @details Invalid values are reported to @p diags as warnings and ignored.
OptionOverrides readEnvironment(const EnvLookup &env, support::DiagnosticEngine &diags);

/// @brief Combine defaults, manifest, environment and @p flags.
/// @param flags Overrides given on the command line.
/// @param configPath Manifest path from the command line; PATHNORM_CONFIG is
///        consulted when absent.
/// @param env Environment lookup.
/// @param diags Receives warnings about ignored environment values.
/// @return Resolved options, or the manifest diagnostic on failure.
support::Expected<FolderPathOptions> resolveOptions(const OptionOverrides &flags,
                                                    const std::optional<std::string> &configPath,
                                                    const EnvLookup &env,
                                                    support::DiagnosticEngine &diags);

} // namespace pathnorm::tools
