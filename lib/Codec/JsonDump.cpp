//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON rendering of decoded object graphs.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/JsonDump.h"

#include "tlcodec/Codec/Shape.h"

#include "llvm/ADT/StringExtras.h"

#include <utility>

namespace tlcodec
{

llvm::json::Value toJson(const Object& object)
{
    llvm::json::Object out;
    out["_"] = object.typeName().str();
    for (const FieldDescriptor& field : object.shape().fields())
    {
        if (field.dump == nullptr)
        {
            continue;
        }
        out[field.name] = field.dump(object);
    }
    return llvm::json::Value(std::move(out));
}

llvm::json::Value textToJson(std::string text)
{
    if (!llvm::json::isUTF8(text))
    {
        return llvm::json::fixUTF8(text);
    }
    return std::move(text);
}

llvm::json::Value bytesToJson(const llvm::ArrayRef<std::uint8_t> bytes)
{
    return llvm::toHex(bytes, /*LowerCase=*/true);
}

}  // namespace tlcodec
