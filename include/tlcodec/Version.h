//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Library version string.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_VERSION_H
#define TLCODEC_VERSION_H

namespace tlcodec
{

/// @brief Semantic version reported by the command-line tool.
inline constexpr const char* kVersionString = "0.3.0";

}  // namespace tlcodec

#endif  // TLCODEC_VERSION_H
