//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/FolderPathField.hpp
// Purpose: Value model of an editable folder path field.
// Key invariants: Every value written through edit() or applySelection() is
//                 normalized with the field's options; a cancelled selection
//                 never modifies the value.
// Ownership/Lifetime: Owns its current value and a copy of the options.
// Links: src/core/FolderPathField.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/FolderPath.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace pathnorm
{

/// @brief Folder path field driven by text edits and folder picker results.
class FolderPathField
{
  public:
    /// @brief Create a field holding @p value verbatim.
    explicit FolderPathField(FolderPathOptions options = {}, std::string value = {});

    [[nodiscard]] const std::string &value() const
    {
        return value_;
    }

    [[nodiscard]] const FolderPathOptions &options() const
    {
        return normalizer_.options();
    }

    /// @brief Store the normalized form of typed @p text.
    /// @return True when the stored value changed.
    bool edit(std::string_view text);

    /// @brief Store the normalized form of a folder picker result.
    /// @param selected Picked folder; empty or absent means the picker was cancelled.
    /// @return True when the stored value changed.
    bool applySelection(const std::optional<std::string> &selected);

  private:
    bool store(std::string normalized);

    PathNormalizer normalizer_;
    std::string value_;
};

} // namespace pathnorm
