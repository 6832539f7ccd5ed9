//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Type-code to shape registry used for polymorphic decoding.
///
/// A registry is assembled once through `TypeRegistry::Builder`, then passed
/// by reference into decode calls. It is never mutated after `build()`, so
/// concurrent decode calls may share one instance.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_TYPE_REGISTRY_H
#define TLCODEC_CODEC_TYPE_REGISTRY_H

#include "tlcodec/Codec/Shape.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace tlcodec
{

/// @brief Registry entry for one type code.
struct RegisteredType final
{
    /// @brief Shape table of the concrete type.
    const Shape* shape{nullptr};

    /// @brief True when the type code alone is the value.
    bool isEnum{false};
};

/// @brief Immutable mapping from type code to concrete shape.
class TypeRegistry final
{
public:
    /// @brief Collects registrations and checks them in `build()`.
    class Builder final
    {
    public:
        /// @brief Registers a shape decoded field by field.
        template <typename T>
        Builder& add()
        {
            return addShape(T::describe(), false);
        }

        /// @brief Registers a nullary, enum-like shape.
        template <typename T>
        Builder& addEnum()
        {
            return addShape(T::describe(), true);
        }

        /// @brief Registers a shape table directly.
        /// @param[in] shape Static shape; must outlive the registry.
        /// @param[in] isEnum True for enum-like variants.
        Builder& addShape(const Shape& shape, bool isEnum);

        /// @brief Validates registrations and produces the registry.
        /// @return Registry, or the first duplicate-code or shape error.
        llvm::Expected<TypeRegistry> build();

    private:
        std::vector<RegisteredType> pending_;
    };

    TypeRegistry() = default;

    /// @brief Finds the entry for `code`.
    /// @return Entry or null.
    [[nodiscard]] const RegisteredType* lookup(std::uint32_t code) const;

    /// @brief True when `code` is registered.
    [[nodiscard]] bool contains(std::uint32_t code) const
    {
        return lookup(code) != nullptr;
    }

    /// @brief True when `code` is registered as an enum-like variant.
    [[nodiscard]] bool isEnum(std::uint32_t code) const;

    /// @brief Creates a zero-valued instance for `code`, or null when unknown.
    [[nodiscard]] std::unique_ptr<Object> instantiate(std::uint32_t code) const;

    /// @brief Number of registered codes.
    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

private:
    std::unordered_map<std::uint32_t, RegisteredType> entries_;
};

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_TYPE_REGISTRY_H
