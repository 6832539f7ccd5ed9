//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Closed sum type over registered object variants.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_ONE_OF_H
#define TLCODEC_CODEC_ONE_OF_H

#include "tlcodec/Codec/Object.h"

#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tlcodec
{

/// @brief Holds at most one object out of a fixed list of concrete shapes.
///
/// The decoder resolves the wire type code through the registry and then
/// narrows the instance to one of `Ts`; any other resolved shape is rejected.
template <typename... Ts>
class OneOf final
{
    static_assert(sizeof...(Ts) > 0, "OneOf needs at least one variant");
    static_assert((std::is_base_of_v<Object, Ts> && ...), "OneOf variants must be decodable objects");

public:
    OneOf() = default;

    /// @brief Constructs from one concrete variant.
    template <typename T, typename = std::enable_if_t<(std::is_same_v<T, Ts> || ...)>>
    explicit OneOf(std::unique_ptr<T> value)
        : storage_(std::move(value))
    {
    }

    /// @brief Returns true when no variant is held.
    [[nodiscard]] bool empty() const
    {
        return std::holds_alternative<std::monostate>(storage_);
    }

    /// @brief Returns the held variant of type `T`, or null.
    template <typename T>
    [[nodiscard]] T* get() const
    {
        if (const auto* held = std::get_if<std::unique_ptr<T>>(&storage_))
        {
            return held->get();
        }
        return nullptr;
    }

    /// @brief Returns the held object through its common base, or null.
    [[nodiscard]] const Object* object() const
    {
        return std::visit(
            [](const auto& held) -> const Object* {
                if constexpr (std::is_same_v<std::decay_t<decltype(held)>, std::monostate>)
                {
                    return nullptr;
                }
                else
                {
                    return held.get();
                }
            },
            storage_);
    }

    /// @brief Takes ownership of `candidate` when it is one of `Ts`.
    /// @param[in,out] candidate Resolved object; released on success.
    /// @return `true` when the object was admitted.
    bool admit(std::unique_ptr<Object>& candidate)
    {
        return (admitAs<Ts>(candidate) || ...);
    }

    /// @brief Describes the admissible variants for diagnostics.
    static std::string describe()
    {
        std::string text = "one of {";
        bool        first = true;
        ((text += (first ? "" : ", "), text += Ts::TypeName.str(), first = false), ...);
        text += "}";
        return text;
    }

private:
    template <typename T>
    bool admitAs(std::unique_ptr<Object>& candidate)
    {
        if (auto* typed = dynamic_cast<T*>(candidate.get()))
        {
            storage_ = std::unique_ptr<T>(typed);
            (void) candidate.release();
            return true;
        }
        return false;
    }

    std::variant<std::monostate, std::unique_ptr<Ts>...> storage_;
};

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_ONE_OF_H
