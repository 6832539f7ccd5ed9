//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Static per-shape field tables.
///
/// A `Shape` lists the fields of one concrete object in wire order. Each
/// field descriptor is bound to a C++ member through plain function thunks
/// generated by `ShapeBuilder`, so no names or tags are parsed at runtime.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_SHAPE_H
#define TLCODEC_CODEC_SHAPE_H

#include "tlcodec/Codec/Object.h"
#include "tlcodec/Codec/ValueKind.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tlcodec
{

/// @brief Number of bits in the optional-field bitset.
inline constexpr std::uint8_t BitsetWidth = 32U;

/// @brief Decodes one member of `object` through `decoder`.
using FieldDecodeFn = llvm::Error (*)(Object& object, Decoder& decoder);

/// @brief Sets a bitflag-valued member to its present value.
using FieldPresenceFn = void (*)(Object& object);

/// @brief Renders one member for diagnostics.
using FieldDumpFn = llvm::json::Value (*)(const Object& object);

/// @brief Creates a zero-valued instance of a shape.
using ObjectFactoryFn = std::unique_ptr<Object> (*)();

/// @brief Declared field of a shape.
struct FieldDescriptor final
{
    /// @brief Schema field name.
    std::string name;

    /// @brief Declared value kind.
    ValueKind kind{ValueKind::Resource};

    /// @brief Optional-encoding metadata; empty for mandatory fields.
    std::optional<FieldFlag> flag;

    /// @brief Member decode thunk.
    FieldDecodeFn decode{nullptr};

    /// @brief Presence thunk; set only for bitflag-valued fields.
    FieldPresenceFn setPresent{nullptr};

    /// @brief Member dump thunk.
    FieldDumpFn dump{nullptr};
};

/// @brief Immutable field table of one concrete shape.
class Shape final
{
public:
    /// @brief Creates an empty table.
    /// @param[in] typeCode Wire type code.
    /// @param[in] typeName Schema name.
    /// @param[in] factory Zero-value factory.
    Shape(std::uint32_t typeCode, llvm::StringRef typeName, ObjectFactoryFn factory);

    /// @brief Appends a field in wire order, recording declaration defects.
    /// @param[in] field Field descriptor.
    void addField(FieldDescriptor field);

    [[nodiscard]] std::uint32_t typeCode() const
    {
        return typeCode_;
    }

    [[nodiscard]] llvm::StringRef typeName() const
    {
        return typeName_;
    }

    /// @brief Returns fields in wire order.
    [[nodiscard]] llvm::ArrayRef<FieldDescriptor> fields() const
    {
        return fields_;
    }

    /// @brief True when at least one field carries a `FieldFlag`.
    [[nodiscard]] bool hasOptionalFields() const
    {
        return hasOptionalFields_;
    }

    /// @brief Creates a zero-valued instance.
    [[nodiscard]] std::unique_ptr<Object> instantiate() const;

    /// @brief Reports the first declaration defect, if any.
    llvm::Error validate() const;

    /// @brief Finds a field by name.
    [[nodiscard]] const FieldDescriptor* findField(llvm::StringRef name) const;

private:
    std::uint32_t                typeCode_;
    std::string                  typeName_;
    ObjectFactoryFn              factory_;
    std::vector<FieldDescriptor> fields_;
    bool                         hasOptionalFields_{false};
    std::string                  defect_;
};

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_SHAPE_H
