//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Builds static shape tables from C++ member pointers.
///
/// Typical use inside a concrete shape:
///
/// @code
/// static const Shape& describe()
/// {
///     static const Shape shape = ShapeBuilder<Pong>()
///                                    .field<&Pong::msgId>("msg_id")
///                                    .field<&Pong::pingId>("ping_id")
///                                    .build();
///     return shape;
/// }
/// @endcode
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_SHAPE_BUILDER_H
#define TLCODEC_CODEC_SHAPE_BUILDER_H

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Codec/JsonDump.h"
#include "tlcodec/Codec/Shape.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace tlcodec
{
namespace detail
{

template <typename M>
struct MemberTraits;

template <typename C, typename V>
struct MemberTraits<V C::*>
{
    using Class = C;
    using Value = V;
};

template <auto Member>
using MemberValue = typename MemberTraits<decltype(Member)>::Value;

template <typename T, auto Member>
llvm::Error decodeMember(Object& object, Decoder& decoder)
{
    return decoder.decodeValue(static_cast<T&>(object).*Member);
}

template <typename T, auto Member>
void markMemberPresent(Object& object)
{
    static_cast<T&>(object).*Member = true;
}

template <typename T, auto Member>
llvm::json::Value dumpMember(const Object& object)
{
    return toJsonValue(static_cast<const T&>(object).*Member);
}

template <typename T>
std::unique_ptr<Object> createObject()
{
    return std::make_unique<T>();
}

}  // namespace detail

/// @brief Collects field descriptors for the concrete shape `T` in wire order.
template <typename T>
class ShapeBuilder final
{
public:
    /// @brief Appends a mandatory field.
    template <auto Member>
    ShapeBuilder& field(llvm::StringRef name)
    {
        return append<Member>(name, std::nullopt, nullptr);
    }

    /// @brief Appends a field whose bytes follow only when `bitIndex` is set.
    template <auto Member>
    ShapeBuilder& optional(llvm::StringRef name, std::uint8_t bitIndex)
    {
        return append<Member>(name, FieldFlag{bitIndex, false}, nullptr);
    }

    /// @brief Appends a `bool` field whose value is the bit itself.
    template <auto Member>
    ShapeBuilder& flag(llvm::StringRef name, std::uint8_t bitIndex)
    {
        static_assert(std::is_same_v<detail::MemberValue<Member>, bool>, "bitflag-valued fields must be bool");
        return append<Member>(name, FieldFlag{bitIndex, true}, &detail::markMemberPresent<T, Member>);
    }

    /// @brief Produces the shape table.
    [[nodiscard]] Shape build()
    {
        Shape shape(T::TypeCode, T::TypeName, &detail::createObject<T>);
        for (FieldDescriptor& field : fields_)
        {
            shape.addField(std::move(field));
        }
        fields_.clear();
        return shape;
    }

private:
    template <auto Member>
    ShapeBuilder& append(llvm::StringRef name, std::optional<FieldFlag> flag, FieldPresenceFn setPresent)
    {
        using Value = detail::MemberValue<Member>;
        static_assert(std::is_base_of_v<typename detail::MemberTraits<decltype(Member)>::Class, T>,
                      "member does not belong to the shape");

        FieldDescriptor descriptor;
        descriptor.name       = name.str();
        descriptor.kind       = valueKindOf<Value>();
        descriptor.flag       = flag;
        descriptor.decode     = &detail::decodeMember<T, Member>;
        descriptor.setPresent = setPresent;
        descriptor.dump       = &detail::dumpMember<T, Member>;
        fields_.push_back(std::move(descriptor));
        return *this;
    }

    std::vector<FieldDescriptor> fields_;
};

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_SHAPE_BUILDER_H
