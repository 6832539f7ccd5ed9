//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Decode trace events and sink integration.
///
/// The decoder reports object resolution, skipped optional fields and failures
/// to an optional sink. Sinks are plain callbacks so tools can forward events
/// to `llvm::errs()` and tests can collect them.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_SUPPORT_TRACE_H
#define TLCODEC_SUPPORT_TRACE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace tlcodec
{

/// @brief Trace verbosity level.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Emit object resolution and failure events.
    Basic,

    /// @brief Additionally emit per-field events.
    Verbose,
};

/// @brief Category of a trace event.
enum class DecodeTraceKind
{
    /// @brief Object decoding started.
    ObjectBegin,

    /// @brief Registry lookup failed for a type code.
    UnknownType,

    /// @brief Optional field skipped because its bit was unset.
    FieldSkipped,

    /// @brief Top-level decode call failed.
    DecodeFailed,
};

/// @brief Immutable trace sample.
struct DecodeTraceEvent final
{
    /// @brief Event category.
    DecodeTraceKind kind{DecodeTraceKind::ObjectBegin};

    /// @brief Type code involved, zero when not applicable.
    std::uint32_t typeCode{0};

    /// @brief Shape or field name, or the failure message.
    std::string text;

    /// @brief Object nesting depth at the time of the event.
    std::uint32_t depth{0};

    /// @brief Reader offset at the time of the event.
    std::size_t offset{0};
};

/// @brief Sink callback invoked for each trace event.
using DecodeTraceSink = std::function<void(const DecodeTraceEvent&)>;

/// @brief Returns the minimal level at which an event kind is emitted.
/// @param[in] kind Event category.
/// @return `Basic` or `Verbose`.
TraceLevel minimumTraceLevel(DecodeTraceKind kind);

/// @brief Renders an event as one `key=value` log line without trailing newline.
/// @param[in] event Trace event.
/// @return Formatted line.
std::string formatTraceEvent(const DecodeTraceEvent& event);

/// @brief Parses `off`, `basic` or `verbose` (case-insensitive).
/// @param[in] text Level name.
/// @param[out] level Parsed level.
/// @return `true` when `text` names a level.
[[nodiscard]] bool parseTraceLevel(const std::string& text, TraceLevel& level);

}  // namespace tlcodec

#endif  // TLCODEC_SUPPORT_TRACE_H
