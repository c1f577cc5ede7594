//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the folder path field model: typed text and picker selections
// both pass through the normalizer before they replace the stored value.
//
//===----------------------------------------------------------------------===//

#include "core/FolderPathField.hpp"

#include <utility>

namespace pathnorm
{

FolderPathField::FolderPathField(FolderPathOptions options, std::string value)
    : normalizer_(options), value_(std::move(value))
{
}

bool FolderPathField::edit(std::string_view text)
{
    return store(normalizer_.normalize(text));
}

bool FolderPathField::applySelection(const std::optional<std::string> &selected)
{
    if (!selected || selected->empty())
        return false;
    return store(normalizer_.normalize(*selected));
}

bool FolderPathField::store(std::string normalized)
{
    if (normalized == value_)
        return false;
    value_ = std::move(normalized);
    return true;
}

} // namespace pathnorm
