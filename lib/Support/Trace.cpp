//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements trace event formatting and level parsing.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Support/Trace.h"

#include "tlcodec/Support/Errors.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace tlcodec
{
namespace
{

llvm::StringRef traceKindName(const DecodeTraceKind kind)
{
    switch (kind)
    {
    case DecodeTraceKind::ObjectBegin:
        return "object";
    case DecodeTraceKind::UnknownType:
        return "unknown-type";
    case DecodeTraceKind::FieldSkipped:
        return "field-skipped";
    case DecodeTraceKind::DecodeFailed:
        return "failed";
    }
    return "event";
}

}  // namespace

TraceLevel minimumTraceLevel(const DecodeTraceKind kind)
{
    return kind == DecodeTraceKind::FieldSkipped ? TraceLevel::Verbose : TraceLevel::Basic;
}

std::string formatTraceEvent(const DecodeTraceEvent& event)
{
    std::string              line;
    llvm::raw_string_ostream os(line);
    os << "event=" << traceKindName(event.kind);
    if (event.typeCode != 0U)
    {
        os << " crc=" << formatTypeCode(event.typeCode);
    }
    os << " depth=" << event.depth << " offset=" << static_cast<std::uint64_t>(event.offset);
    if (!event.text.empty())
    {
        os << " text=\"" << event.text << "\"";
    }
    os.flush();
    return line;
}

bool parseTraceLevel(const std::string& text, TraceLevel& level)
{
    const std::string normalized = llvm::StringRef(text).trim().lower();
    if (normalized == "off")
    {
        level = TraceLevel::Off;
        return true;
    }
    if (normalized == "basic")
    {
        level = TraceLevel::Basic;
        return true;
    }
    if (normalized == "verbose")
    {
        level = TraceLevel::Verbose;
        return true;
    }
    return false;
}

}  // namespace tlcodec
