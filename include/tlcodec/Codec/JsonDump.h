//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON rendering of decoded object graphs.
///
/// Objects render as `{"_": typeName, field: value, ...}` using the shape
/// tables. Byte strings render as lowercase hex and absent objects as `null`.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_JSON_DUMP_H
#define TLCODEC_CODEC_JSON_DUMP_H

#include "tlcodec/Codec/Object.h"
#include "tlcodec/Codec/OneOf.h"
#include "tlcodec/Codec/ValueKind.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace tlcodec
{

/// @brief Renders one decoded object through its shape table.
llvm::json::Value toJson(const Object& object);

/// @brief Renders text, replacing invalid UTF-8 sequences.
llvm::json::Value textToJson(std::string text);

/// @brief Renders raw bytes as a lowercase hex string.
llvm::json::Value bytesToJson(llvm::ArrayRef<std::uint8_t> bytes);

/// @brief Renders one value according to the declared kind of `T`.
template <typename T>
llvm::json::Value toJsonValue(const T& value)
{
    constexpr ValueKind kind = valueKindOf<T>();

    if constexpr (std::is_base_of_v<Object, T>)
    {
        return toJson(value);
    }
    else if constexpr (kind == ValueKind::Custom)
    {
        return value.dumpJson();
    }
    else if constexpr (kind == ValueKind::Float64 || kind == ValueKind::Bool)
    {
        return value;
    }
    else if constexpr (kind == ValueKind::Int64 || kind == ValueKind::UInt32 || kind == ValueKind::Int32)
    {
        return static_cast<std::int64_t>(value);
    }
    else if constexpr (kind == ValueKind::Enum32)
    {
        return static_cast<std::int64_t>(static_cast<std::uint32_t>(value));
    }
    else if constexpr (kind == ValueKind::String)
    {
        return textToJson(value);
    }
    else if constexpr (kind == ValueKind::Bytes)
    {
        return bytesToJson(value);
    }
    else if constexpr (kind == ValueKind::Vector)
    {
        llvm::json::Array elements;
        for (const auto& element : value)
        {
            elements.push_back(toJsonValue(element));
        }
        return elements;
    }
    else if constexpr (kind == ValueKind::Object || kind == ValueKind::Indirection ||
                       (kind == ValueKind::Polymorphic && detail::IsUniquePtr<T>::value))
    {
        if (!value)
        {
            return nullptr;
        }
        return toJsonValue(*value);
    }
    else if constexpr (kind == ValueKind::Polymorphic)
    {
        const Object* held = value.object();
        return held != nullptr ? toJson(*held) : llvm::json::Value(nullptr);
    }
    else
    {
        return "<unsupported>";
    }
}

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_JSON_DUMP_H
