//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Closed value-kind tag computed from C++ field types.
///
/// The decoder dispatches on this tag instead of inspecting live type
/// metadata. Unsupported kinds are still classified so the decoder can report
/// them by name.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_VALUE_KIND_H
#define TLCODEC_CODEC_VALUE_KIND_H

#include "tlcodec/Codec/Object.h"

#include "llvm/ADT/StringRef.h"

#include <array>
#include <complex>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace tlcodec
{

template <typename... Ts>
class OneOf;

/// @brief Declared kind of a decode target.
enum class ValueKind
{
    /// @brief 64-bit IEEE-754 double.
    Float64,

    /// @brief Signed 64-bit integer.
    Int64,

    /// @brief Unsigned 32-bit integer.
    UInt32,

    /// @brief Signed 32-bit integer narrowed from the 32-bit wire read.
    Int32,

    /// @brief Boxed boolean.
    Bool,

    /// @brief Byte string interpreted as text.
    String,

    /// @brief Raw byte string.
    Bytes,

    /// @brief Homogeneous boxed vector.
    Vector,

    /// @brief Concrete object, held in place or exclusively owned; type code checked.
    Object,

    /// @brief Owning indirection to a non-object value.
    Indirection,

    /// @brief Polymorphic target resolved through the type registry.
    Polymorphic,

    /// @brief 32-bit enumeration read as an unsigned 32-bit value.
    Enum32,

    /// @brief Value implementing `CustomDecodable`.
    Custom,

    /// @brief Fixed-size array (unsupported).
    FixedArray,

    /// @brief Associative container (unsupported).
    Map,

    /// @brief Class held by value that is not decodable (unsupported).
    PlainStruct,

    /// @brief Integer width other than int32, int64 or uint32 (unsupported).
    NarrowInteger,

    /// @brief 32-bit or extended floating point (unsupported).
    Float32,

    /// @brief Complex number (unsupported).
    Complex,

    /// @brief Raw pointer, function or other resource handle (unsupported).
    Resource,
};

/// @brief Returns the diagnostic name of a kind.
llvm::StringRef kindName(ValueKind kind);

/// @brief Returns a hint naming the supported alternative for an unsupported kind.
llvm::StringRef unsupportedKindHint(ValueKind kind);

/// @brief True for kinds the decoder handles.
constexpr bool isSupportedKind(const ValueKind kind)
{
    switch (kind)
    {
    case ValueKind::FixedArray:
    case ValueKind::Map:
    case ValueKind::PlainStruct:
    case ValueKind::NarrowInteger:
    case ValueKind::Float32:
    case ValueKind::Complex:
    case ValueKind::Resource:
        return false;
    default:
        return true;
    }
}

namespace detail
{

template <typename T>
struct IsVector : std::false_type
{};

template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type
{};

template <typename T>
struct IsUniquePtr : std::false_type
{};

template <typename T>
struct IsUniquePtr<std::unique_ptr<T>> : std::true_type
{};

template <typename T>
struct IsOneOf : std::false_type
{};

template <typename... Ts>
struct IsOneOf<OneOf<Ts...>> : std::true_type
{};

template <typename T>
struct IsMap : std::false_type
{};

template <typename K, typename V, typename C, typename A>
struct IsMap<std::map<K, V, C, A>> : std::true_type
{};

template <typename K, typename V, typename H, typename E, typename A>
struct IsMap<std::unordered_map<K, V, H, E, A>> : std::true_type
{};

template <typename T>
struct IsStdArray : std::false_type
{};

template <typename T, std::size_t N>
struct IsStdArray<std::array<T, N>> : std::true_type
{};

template <typename T>
struct IsComplex : std::false_type
{};

template <typename T>
struct IsComplex<std::complex<T>> : std::true_type
{};

template <typename P>
constexpr ValueKind pointeeKind()
{
    if constexpr (std::is_base_of_v<Object, P>)
    {
        return std::is_abstract_v<P> ? ValueKind::Polymorphic : ValueKind::Object;
    }
    else
    {
        return ValueKind::Indirection;
    }
}

}  // namespace detail

/// @brief Classifies a C++ target type.
template <typename T>
constexpr ValueKind valueKindOf()
{
    if constexpr (std::is_base_of_v<CustomDecodable, T>)
    {
        return ValueKind::Custom;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return ValueKind::Float64;
    }
    else if constexpr (std::is_same_v<T, std::int64_t>)
    {
        return ValueKind::Int64;
    }
    else if constexpr (std::is_same_v<T, std::uint32_t>)
    {
        return ValueKind::UInt32;
    }
    else if constexpr (std::is_same_v<T, std::int32_t>)
    {
        return ValueKind::Int32;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return ValueKind::Bool;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        return ValueKind::String;
    }
    else if constexpr (std::is_enum_v<T>)
    {
        return sizeof(std::underlying_type_t<T>) == sizeof(std::uint32_t) ? ValueKind::Enum32
                                                                          : ValueKind::NarrowInteger;
    }
    else if constexpr (detail::IsVector<T>::value)
    {
        return std::is_same_v<typename T::value_type, std::uint8_t> ? ValueKind::Bytes : ValueKind::Vector;
    }
    else if constexpr (detail::IsUniquePtr<T>::value)
    {
        return detail::pointeeKind<typename T::element_type>();
    }
    else if constexpr (detail::IsOneOf<T>::value)
    {
        return ValueKind::Polymorphic;
    }
    else if constexpr (std::is_base_of_v<Object, T> && !std::is_abstract_v<T>)
    {
        return ValueKind::Object;
    }
    else if constexpr (detail::IsStdArray<T>::value || std::is_array_v<T>)
    {
        return ValueKind::FixedArray;
    }
    else if constexpr (detail::IsMap<T>::value)
    {
        return ValueKind::Map;
    }
    else if constexpr (detail::IsComplex<T>::value)
    {
        return ValueKind::Complex;
    }
    else if constexpr (std::is_integral_v<T>)
    {
        return ValueKind::NarrowInteger;
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        return ValueKind::Float32;
    }
    else if constexpr (std::is_class_v<T>)
    {
        return ValueKind::PlainStruct;
    }
    else
    {
        return ValueKind::Resource;
    }
}

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_VALUE_KIND_H
