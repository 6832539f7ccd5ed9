//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements value-kind naming for diagnostics.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/ValueKind.h"

namespace tlcodec
{

llvm::StringRef kindName(const ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::Float64:
        return "float64";
    case ValueKind::Int64:
        return "int64";
    case ValueKind::UInt32:
        return "uint32";
    case ValueKind::Int32:
        return "int32";
    case ValueKind::Bool:
        return "bool";
    case ValueKind::String:
        return "string";
    case ValueKind::Bytes:
        return "bytes";
    case ValueKind::Vector:
        return "vector";
    case ValueKind::Object:
        return "object";
    case ValueKind::Indirection:
        return "indirection";
    case ValueKind::Polymorphic:
        return "polymorphic";
    case ValueKind::Enum32:
        return "enum32";
    case ValueKind::Custom:
        return "custom";
    case ValueKind::FixedArray:
        return "array";
    case ValueKind::Map:
        return "map";
    case ValueKind::PlainStruct:
        return "struct";
    case ValueKind::NarrowInteger:
        return "integer";
    case ValueKind::Float32:
        return "float";
    case ValueKind::Complex:
        return "complex";
    case ValueKind::Resource:
        return "resource";
    }
    return "unknown";
}

llvm::StringRef unsupportedKindHint(const ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::FixedArray:
        return "array must be a std::vector";
    case ValueKind::Map:
        return "map is not an ordered object (declare a shape with ordered fields)";
    case ValueKind::PlainStruct:
        return "struct must derive from tlcodec::ObjectBase";
    case ValueKind::NarrowInteger:
        return "integer must be std::int32_t, std::int64_t or std::uint32_t";
    case ValueKind::Float32:
        return "floating point must be double";
    case ValueKind::Complex:
        return "complex numbers have no wire representation";
    case ValueKind::Resource:
        return "raw pointers and handles cannot be decoded";
    default:
        return "";
    }
}

}  // namespace tlcodec
