//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration for decode calls.
///
/// Options are passed by value into each top-level decode entry point. Tools
/// may populate them from a JSON settings document.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_SUPPORT_DECODER_CONFIG_H
#define TLCODEC_SUPPORT_DECODER_CONFIG_H

#include "tlcodec/Support/Trace.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>

namespace tlcodec
{

/// @brief Default bound on object nesting.
inline constexpr std::uint32_t DefaultMaxDepth = 64U;

/// @brief Per-call decoder configuration.
struct DecoderOptions final
{
    /// @brief Maximum object nesting depth; zero disables the guard.
    std::uint32_t maxDepth{DefaultMaxDepth};

    /// @brief Attach the unread remainder to unknown-type errors.
    bool captureUnknownRemainder{true};

    /// @brief Trace verbosity.
    TraceLevel traceLevel{TraceLevel::Off};

    /// @brief Trace sink; empty disables tracing regardless of level.
    DecodeTraceSink traceSink;
};

/// @brief Applies a settings object such as `{"maxDepth": 16, "trace": "basic"}`.
///
/// Absent or mistyped keys leave the corresponding option unchanged.
///
/// @param[in] settings Settings document.
/// @param[in,out] options Options to update.
/// @return `true` when `settings` is a JSON object.
[[nodiscard]] bool applyDecoderSettings(const llvm::json::Value& settings, DecoderOptions& options);

/// @brief Reads and applies a JSON settings file.
/// @param[in] path File path.
/// @param[in,out] options Options to update.
/// @return Error when the file cannot be read, parsed, or is not an object.
llvm::Error loadDecoderSettingsFile(llvm::StringRef path, DecoderOptions& options);

}  // namespace tlcodec

#endif  // TLCODEC_SUPPORT_DECODER_CONFIG_H
