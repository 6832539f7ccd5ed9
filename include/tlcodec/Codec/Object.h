//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Decodable object capability and the optional custom-decode capability.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_OBJECT_H
#define TLCODEC_CODEC_OBJECT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>

namespace tlcodec
{
class Decoder;
class Shape;

/// @brief Per-field optional encoding metadata.
struct FieldFlag final
{
    /// @brief Bit selected in the optional-field bitset (0..31).
    std::uint8_t bitIndex{0};

    /// @brief True when the field value is "bit is set" and no bytes follow.
    bool isBitflagValued{false};
};

/// @brief Any shape identified on the wire by a constant type code.
///
/// Concrete shapes derive through `ObjectBase`; abstract subclasses of
/// `Object` name polymorphic families (a TL "type" with several constructors).
class Object
{
public:
    virtual ~Object() = default;

    /// @brief Returns the constant wire type code of the concrete shape.
    [[nodiscard]] virtual std::uint32_t typeCode() const = 0;

    /// @brief Returns the schema name of the concrete shape.
    [[nodiscard]] virtual llvm::StringRef typeName() const = 0;

    /// @brief Returns the static field table of the concrete shape.
    [[nodiscard]] virtual const Shape& shape() const = 0;
};

/// @brief Capability for shapes that decode themselves.
///
/// When a target implements this interface the generic field traversal is not
/// used. For objects the decoder has already consumed and checked the type
/// code; `decodeCustom` reads the body only.
class CustomDecodable
{
public:
    virtual ~CustomDecodable() = default;

    /// @brief Decodes the value from the decoder's reader.
    /// @param[in,out] decoder Active decoder.
    /// @return Failure to propagate unchanged.
    virtual llvm::Error decodeCustom(Decoder& decoder) = 0;

    /// @brief Renders the value for diagnostics; objects use their shape instead.
    [[nodiscard]] virtual llvm::json::Value dumpJson() const
    {
        return nullptr;
    }
};

/// @brief CRTP base binding the static shape description to `Object`.
///
/// `Derived` provides `TypeCode`, `TypeName` and `describe()`. `Family` is the
/// polymorphic family the shape belongs to (itself derived from `Object`).
template <typename Derived, typename Family = Object>
class ObjectBase : public Family
{
public:
    [[nodiscard]] std::uint32_t typeCode() const override
    {
        return Derived::TypeCode;
    }

    [[nodiscard]] llvm::StringRef typeName() const override
    {
        return Derived::TypeName;
    }

    [[nodiscard]] const Shape& shape() const override
    {
        return Derived::describe();
    }
};

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_OBJECT_H
