//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements decoder option updates from JSON settings.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Support/DecoderConfig.h"

#include "llvm/Support/MemoryBuffer.h"

#include <limits>
#include <memory>
#include <string>

namespace tlcodec
{
namespace
{

void applyMaxDepth(const llvm::json::Object& settings, DecoderOptions& options)
{
    if (const auto depth = settings.getInteger("maxDepth"))
    {
        if (*depth >= 0 && *depth <= static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        {
            options.maxDepth = static_cast<std::uint32_t>(*depth);
        }
    }
}

void applyTraceLevel(const llvm::json::Object& settings, DecoderOptions& options)
{
    if (const auto rawTrace = settings.getString("trace"))
    {
        TraceLevel level = TraceLevel::Off;
        if (parseTraceLevel(rawTrace->str(), level))
        {
            options.traceLevel = level;
        }
    }
}

}  // namespace

bool applyDecoderSettings(const llvm::json::Value& settings, DecoderOptions& options)
{
    const auto* object = settings.getAsObject();
    if (!object)
    {
        return false;
    }

    applyMaxDepth(*object, options);
    if (const auto capture = object->getBoolean("captureUnknownRemainder"))
    {
        options.captureUnknownRemainder = *capture;
    }
    applyTraceLevel(*object, options);
    return true;
}

llvm::Error loadDecoderSettingsFile(const llvm::StringRef path, DecoderOptions& options)
{
    auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufferOrErr)
    {
        return llvm::createStringError(bufferOrErr.getError(), "failed to read %s", path.str().c_str());
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse((*bufferOrErr)->getBuffer());
    if (!parsed)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid settings JSON in %s: %s",
                                       path.str().c_str(),
                                       llvm::toString(parsed.takeError()).c_str());
    }

    if (!applyDecoderSettings(*parsed, options))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "settings in %s must be a JSON object",
                                       path.str().c_str());
    }
    return llvm::Error::success();
}

}  // namespace tlcodec
