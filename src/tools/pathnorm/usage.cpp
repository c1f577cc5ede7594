//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements usage and version output for the `pathnorm` CLI tool.

#include "tools/pathnorm/cli.hpp"

#include "core/OptionNames.hpp"
#include "pathnorm/version.hpp"

#include <ostream>

namespace pathnorm::tools
{
namespace
{
template <class Values> void printNames(std::ostream &os, const Values &values)
{
    for (std::size_t i = 0; i < values.size(); ++i)
        os << (i == 0 ? "" : "|") << toString(values[i]);
}
} // namespace

void printVersion(std::ostream &os)
{
    os << "pathnorm v" << PATHNORM_VERSION_STR << "\n";
}

/// @brief Print usage information for the `pathnorm` command.
/// @details Option value lists are generated from the enum tables so the help
///          text cannot drift from what the parser accepts.
void printUsage(std::ostream &os)
{
    os << "pathnorm v" << PATHNORM_VERSION_STR << " - folder path normalizer\n"
       << "\n"
       << "Usage: pathnorm [options] [PATH...]\n"
       << "       pathnorm [options] < paths.txt\n"
       << "\n"
       << "Each PATH (or each line of stdin when no PATH is given) is printed in\n"
       << "normalized form on its own line.\n"
       << "\n"
       << "Options:\n"
       << "  --root ";
    printNames(os, kAllFolderRoots);
    os << "\n"
       << "                                 Root the path is relative to (default: assets)\n"
       << "  --slashes ";
    printNames(os, kAllSlashTypes);
    os << "\n"
       << "                                 Output separator; windows/unix are aliases of\n"
       << "                                 forward/backward (default: forward)\n"
       << "  --leading ";
    printNames(os, kAllSlashRequirements);
    os << "\n"
       << "                                 Leading separator policy, assets root only\n"
       << "                                 (default: omit)\n"
       << "  --trailing ";
    printNames(os, kAllSlashRequirements);
    os << "\n"
       << "                                 Trailing separator policy, filesystem and\n"
       << "                                 assets roots only (default: include)\n"
       << "  --config FILE                  Read options from a pathnorm.config manifest\n"
       << "  --check                        List inputs that are not normalized; exit 1 if any\n"
       << "  --trace                        Print every normalization stage to stderr\n"
       << "  --show-config                  Print the resolved options and exit\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Environment:\n"
       << "  PATHNORM_CONFIG                Manifest used when --config is absent\n"
       << "  PATHNORM_ROOT, PATHNORM_SLASHES, PATHNORM_LEADING, PATHNORM_TRAILING\n"
       << "                                 Override manifest values; flags override these\n"
       << "\n"
       << "Examples:\n"
       << "  pathnorm C:/MyGame/Assets/MyFolder          -> Assets/MyFolder/\n"
       << "  pathnorm --root resources C:/MyGame/Assets/Resources/Sfx\n"
       << "                                              -> Sfx\n";
}

} // namespace pathnorm::tools
