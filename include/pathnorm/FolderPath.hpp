//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/pathnorm/FolderPath.hpp
// Purpose: Stable façade exposing the folder path normalizer, its option
//          names and the folder path field model.
// Key invariants: Mirrors the core/ public API only.
// Ownership/Lifetime: Header-only forwarding; no state.
// Links: src/core/FolderPath.hpp, src/core/FolderPathField.hpp
#pragma once

#include "core/FolderPath.hpp"
#include "core/FolderPathField.hpp"
#include "core/OptionNames.hpp"

/// @file include/pathnorm/FolderPath.hpp
/// @brief Public forwarding header so downstreams need not include src/core
///        paths directly.
