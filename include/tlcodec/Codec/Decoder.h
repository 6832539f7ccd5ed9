//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Generic value decoder, object field decoder and registered-type resolver.
///
/// One `Decoder` drives one decode call over one `Reader`. Every step returns
/// an `llvm::Error`; the first failure short-circuits all remaining reads and
/// picks up context (field name, shape name) while it unwinds.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_CODEC_DECODER_H
#define TLCODEC_CODEC_DECODER_H

#include "tlcodec/Codec/Object.h"
#include "tlcodec/Codec/OneOf.h"
#include "tlcodec/Codec/Shape.h"
#include "tlcodec/Codec/TypeRegistry.h"
#include "tlcodec/Codec/ValueKind.h"
#include "tlcodec/Support/DecoderConfig.h"
#include "tlcodec/Support/Errors.h"
#include "tlcodec/Support/Trace.h"
#include "tlcodec/Wire/Reader.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/TypeName.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace tlcodec
{

/// @brief Decode engine bound to one reader for the duration of one call.
class Decoder final
{
public:
    /// @brief Binds the engine to its collaborators.
    /// @param[in,out] reader Primitive reader over the input buffer.
    /// @param[in] registry Registry used for polymorphic targets.
    /// @param[in] options Per-call options.
    Decoder(Reader& reader, const TypeRegistry& registry, const DecoderOptions& options);

    Decoder(const Decoder&)            = delete;
    Decoder& operator=(const Decoder&) = delete;

    /// @brief Decodes one value according to the declared kind of `T`.
    ///
    /// Custom-decodable targets decode themselves. Unsupported kinds fail with
    /// `UnsupportedShapeError` before any byte is consumed.
    template <typename T>
    llvm::Error decodeValue(T& target);

    /// @brief Populates `target` field by field.
    ///
    /// @param[in,out] target Instantiated object.
    /// @param[in] skipTypeCode True when the caller already consumed the type code.
    /// @return First failure, annotated with the failing field name.
    llvm::Error decodeObject(Object& target, bool skipTypeCode);

    /// @brief Reads a type code and decodes the registered shape it names.
    /// @return Decoded object; `UnknownTypeError` for unregistered codes.
    llvm::Expected<std::unique_ptr<Object>> decodeRegistered();

    /// @brief Returns the primitive reader.
    [[nodiscard]] Reader& reader()
    {
        return reader_;
    }

    /// @brief Returns the registry.
    [[nodiscard]] const TypeRegistry& registry() const
    {
        return registry_;
    }

    /// @brief Returns the active options.
    [[nodiscard]] const DecoderOptions& options() const
    {
        return options_;
    }

    /// @brief Returns the current object nesting depth.
    [[nodiscard]] std::uint32_t depth() const
    {
        return depth_;
    }

    /// @brief Forwards an event to the trace sink when its level is enabled.
    void trace(DecodeTraceKind kind, std::uint32_t typeCode, const llvm::Twine& text);

    /// @brief Annotates a top-level failure with `context` and traces it.
    /// @param[in] err Result of the top-level decode step.
    /// @param[in] context Outermost context entry.
    /// @return `err` with context, or success.
    llvm::Error finish(llvm::Error err, const llvm::Twine& context);

private:
    /// @brief Tracks one level of object nesting.
    class DepthScope final
    {
    public:
        explicit DepthScope(Decoder& decoder)
            : decoder_(decoder)
        {
            ++decoder_.depth_;
        }

        ~DepthScope()
        {
            --decoder_.depth_;
        }

        DepthScope(const DepthScope&)            = delete;
        DepthScope& operator=(const DepthScope&) = delete;

    private:
        Decoder& decoder_;
    };

    /// @brief Fails when entering one more object would exceed the depth limit.
    llvm::Error checkDepth() const;

    /// @brief Reads and checks the leading type code of `shape`.
    llvm::Error expectTypeCode(const Shape& shape);

    /// @brief Decodes a concrete object in place, checking its type code first.
    template <typename P>
    llvm::Error decodeConcrete(P& target);

    /// @brief Decodes an owned concrete object, allocating it when empty.
    template <typename P>
    llvm::Error decodeOwnedObject(std::unique_ptr<P>& target);

    /// @brief Resolves a polymorphic target through the registry.
    template <typename T>
    llvm::Error decodeInterface(T& target);

    template <typename T>
    static llvm::Error unsupported()
    {
        constexpr ValueKind kind = valueKindOf<T>();
        return llvm::make_error<UnsupportedShapeError>(
            kindName(kind), (unsupportedKindHint(kind) + " (target " + llvm::getTypeName<T>() + ")").str());
    }

    template <typename T, typename V>
    static llvm::Error store(llvm::Expected<V> valueOrErr, T& target)
    {
        if (!valueOrErr)
        {
            return valueOrErr.takeError();
        }
        target = static_cast<T>(std::move(*valueOrErr));
        return llvm::Error::success();
    }

    Reader&               reader_;
    const TypeRegistry&   registry_;
    const DecoderOptions& options_;
    std::uint32_t         depth_{0};
};

template <typename T>
llvm::Error Decoder::decodeValue(T& target)
{
    constexpr ValueKind kind = valueKindOf<T>();

    if constexpr (kind == ValueKind::Custom)
    {
        if constexpr (std::is_base_of_v<Object, T>)
        {
            return decodeConcrete(target);
        }
        else
        {
            return target.decodeCustom(*this);
        }
    }
    else if constexpr (kind == ValueKind::Float64)
    {
        return store(reader_.readF64(), target);
    }
    else if constexpr (kind == ValueKind::Int64)
    {
        return store(reader_.readI64(), target);
    }
    else if constexpr (kind == ValueKind::UInt32 || kind == ValueKind::Int32 || kind == ValueKind::Enum32)
    {
        return store(reader_.readU32(), target);
    }
    else if constexpr (kind == ValueKind::Bool)
    {
        return store(reader_.readBool(), target);
    }
    else if constexpr (kind == ValueKind::String)
    {
        return store(reader_.readString(), target);
    }
    else if constexpr (kind == ValueKind::Bytes)
    {
        return store(reader_.readByteMessage(), target);
    }
    else if constexpr (kind == ValueKind::Vector)
    {
        using Element = typename T::value_type;
        if constexpr (!isSupportedKind(valueKindOf<Element>()))
        {
            return unsupported<Element>();
        }
        else
        {
            return reader_.readVector(target, [this](Element& element) { return decodeValue(element); });
        }
    }
    else if constexpr (kind == ValueKind::Object)
    {
        if constexpr (detail::IsUniquePtr<T>::value)
        {
            return decodeOwnedObject(target);
        }
        else
        {
            return decodeConcrete(target);
        }
    }
    else if constexpr (kind == ValueKind::Indirection)
    {
        using Pointee = typename T::element_type;
        if constexpr (!isSupportedKind(valueKindOf<Pointee>()))
        {
            return unsupported<Pointee>();
        }
        else
        {
            if (!target)
            {
                target = std::make_unique<Pointee>();
            }
            return decodeValue(*target);
        }
    }
    else if constexpr (kind == ValueKind::Polymorphic)
    {
        return withContext(decodeInterface(target), "decode interface");
    }
    else
    {
        return unsupported<T>();
    }
}

template <typename P>
llvm::Error Decoder::decodeConcrete(P& target)
{
    if (auto err = checkDepth())
    {
        return err;
    }
    DepthScope scope(*this);

    if constexpr (std::is_base_of_v<CustomDecodable, P>)
    {
        if (auto err = expectTypeCode(target.shape()))
        {
            return withContext(std::move(err), "decode " + P::TypeName);
        }
        trace(DecodeTraceKind::ObjectBegin, P::TypeCode, P::TypeName);
        return static_cast<CustomDecodable&>(target).decodeCustom(*this);
    }
    else
    {
        return withContext(decodeObject(target, false), "decode " + P::TypeName);
    }
}

template <typename P>
llvm::Error Decoder::decodeOwnedObject(std::unique_ptr<P>& target)
{
    if (!target)
    {
        target = std::make_unique<P>();
    }
    return decodeConcrete(*target);
}

template <typename T>
llvm::Error Decoder::decodeInterface(T& target)
{
    auto objectOrErr = decodeRegistered();
    if (!objectOrErr)
    {
        return objectOrErr.takeError();
    }
    std::unique_ptr<Object> object = std::move(*objectOrErr);

    if constexpr (detail::IsOneOf<T>::value)
    {
        if (target.admit(object))
        {
            return llvm::Error::success();
        }
        return llvm::make_error<UnexpectedVariantError>(object->typeCode(), object->typeName(), T::describe());
    }
    else
    {
        using Family = typename T::element_type;
        if constexpr (std::is_same_v<Family, Object>)
        {
            target = std::move(object);
            return llvm::Error::success();
        }
        else
        {
            auto* typed = dynamic_cast<Family*>(object.get());
            if (typed == nullptr)
            {
                return llvm::make_error<UnexpectedVariantError>(object->typeCode(),
                                                                object->typeName(),
                                                                llvm::getTypeName<Family>());
            }
            target.reset(typed);
            (void) object.release();
            return llvm::Error::success();
        }
    }
}

/// @brief Decodes `buffer` into the object or value pointed to by `target`.
///
/// Fails with `InvalidTargetError` for a null or const target without reading.
/// On failure `*target` may be partially populated.
///
/// @param[in] buffer Input bytes.
/// @param[out] target Destination.
/// @param[in] registry Registry for polymorphic members.
/// @param[in] options Per-call options.
/// @return Failure annotated with the target type name.
template <typename T>
llvm::Error decode(llvm::ArrayRef<std::uint8_t> buffer,
                   T*                           target,
                   const TypeRegistry&          registry,
                   const DecoderOptions&        options = DecoderOptions{})
{
    if constexpr (std::is_const_v<T>)
    {
        return llvm::make_error<InvalidTargetError>("target " + llvm::getTypeName<T>().str() + " is not mutable");
    }
    else
    {
        if (target == nullptr)
        {
            return llvm::make_error<InvalidTargetError>("can't decode into a null target");
        }

        Reader  reader(buffer);
        Decoder decoder(reader, registry, options);
        return decoder.finish(decoder.decodeValue(*target), "decode " + llvm::getTypeName<T>());
    }
}

/// @brief Rejects targets that are not pointers.
template <typename T, typename = std::enable_if_t<!std::is_pointer_v<T>>>
llvm::Error decode(llvm::ArrayRef<std::uint8_t> /*buffer*/,
                   const T& /*target*/,
                   const TypeRegistry& /*registry*/,
                   const DecoderOptions& /*options*/ = DecoderOptions{})
{
    if constexpr (std::is_null_pointer_v<T>)
    {
        return llvm::make_error<InvalidTargetError>("can't decode into a null target");
    }
    else
    {
        return llvm::make_error<InvalidTargetError>("target " + llvm::getTypeName<T>().str() +
                                                    " is not a pointer as expected");
    }
}

/// @brief Decodes a registered object whose concrete shape is named by the leading type code.
/// @param[in] buffer Input bytes.
/// @param[in] registry Registry.
/// @param[in] options Per-call options.
/// @return Decoded object or a failure annotated with `decode registered object`.
llvm::Expected<std::unique_ptr<Object>> decodeRegistered(llvm::ArrayRef<std::uint8_t> buffer,
                                                         const TypeRegistry&          registry,
                                                         const DecoderOptions&        options = DecoderOptions{});

}  // namespace tlcodec

#endif  // TLCODEC_CODEC_DECODER_H
