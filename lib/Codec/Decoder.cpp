//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the object field decoder and the registered-type resolver.
///
/// The value dispatch itself is a template in the header; this unit holds the
/// non-template steps that operate on shape tables and the registry.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/Decoder.h"

#include <vector>

namespace tlcodec
{

Decoder::Decoder(Reader& reader, const TypeRegistry& registry, const DecoderOptions& options)
    : reader_(reader)
    , registry_(registry)
    , options_(options)
{
}

void Decoder::trace(const DecodeTraceKind kind, const std::uint32_t typeCode, const llvm::Twine& text)
{
    if (!options_.traceSink || options_.traceLevel == TraceLevel::Off || options_.traceLevel < minimumTraceLevel(kind))
    {
        return;
    }
    options_.traceSink(DecodeTraceEvent{kind, typeCode, text.str(), depth_, reader_.offset()});
}

llvm::Error Decoder::finish(llvm::Error err, const llvm::Twine& context)
{
    if (!err)
    {
        return llvm::Error::success();
    }

    err = withContext(std::move(err), context);
    if (options_.traceSink && options_.traceLevel != TraceLevel::Off)
    {
        std::string message;
        err = llvm::handleErrors(std::move(err), [&message](std::unique_ptr<DecodeError> payload) -> llvm::Error {
            message = payload->message();
            return llvm::Error(std::move(payload));
        });
        trace(DecodeTraceKind::DecodeFailed, 0U, message);
    }
    return err;
}

llvm::Error Decoder::checkDepth() const
{
    if (options_.maxDepth != 0U && depth_ >= options_.maxDepth)
    {
        return llvm::make_error<DepthLimitError>(options_.maxDepth);
    }
    return llvm::Error::success();
}

llvm::Error Decoder::expectTypeCode(const Shape& shape)
{
    auto crcOrErr = reader_.readTypeCode();
    if (!crcOrErr)
    {
        return withContext(llvm::make_error<CrcReadError>(llvm::toString(crcOrErr.takeError())), "read crc");
    }
    if (*crcOrErr != shape.typeCode())
    {
        return llvm::make_error<CrcMismatchError>(*crcOrErr, shape.typeCode());
    }
    return llvm::Error::success();
}

llvm::Error Decoder::decodeObject(Object& target, const bool skipTypeCode)
{
    const Shape& shape = target.shape();
    if (auto err = shape.validate())
    {
        return err;
    }

    if (!skipTypeCode)
    {
        if (auto err = expectTypeCode(shape))
        {
            return err;
        }
    }
    trace(DecodeTraceKind::ObjectBegin, shape.typeCode(), shape.typeName());

    std::uint32_t bitset = 0U;
    if (shape.hasOptionalFields())
    {
        auto bitsetOrErr = reader_.readU32();
        if (!bitsetOrErr)
        {
            return withContext(llvm::make_error<BitsetReadError>(llvm::toString(bitsetOrErr.takeError())),
                               "read bitset");
        }
        bitset = *bitsetOrErr;
    }

    for (const FieldDescriptor& field : shape.fields())
    {
        if (field.flag)
        {
            if ((bitset & (1U << field.flag->bitIndex)) == 0U)
            {
                trace(DecodeTraceKind::FieldSkipped, shape.typeCode(), field.name);
                continue;
            }
            if (field.flag->isBitflagValued)
            {
                field.setPresent(target);
                continue;
            }
        }

        if (auto err = field.decode(target, *this))
        {
            return withContext(std::move(err), "decode field '" + field.name + "'");
        }
    }
    return llvm::Error::success();
}

llvm::Expected<std::unique_ptr<Object>> Decoder::decodeRegistered()
{
    auto crcOrErr = reader_.readTypeCode();
    if (!crcOrErr)
    {
        return withContext(llvm::make_error<CrcReadError>(llvm::toString(crcOrErr.takeError())), "read crc");
    }
    const std::uint32_t code = *crcOrErr;

    const RegisteredType* entry = registry_.lookup(code);
    if (entry == nullptr)
    {
        std::vector<std::uint8_t> remainder;
        if (options_.captureUnknownRemainder)
        {
            // The dump is diagnostic only; a failed dump leaves it empty.
            auto dumpOrErr = reader_.readRemainderWithoutConsuming();
            if (dumpOrErr)
            {
                remainder = std::move(*dumpOrErr);
            }
            else
            {
                llvm::consumeError(dumpOrErr.takeError());
            }
        }
        trace(DecodeTraceKind::UnknownType, code, llvm::Twine(remainder.size()) + " unread bytes");
        return llvm::make_error<UnknownTypeError>(code, std::move(remainder));
    }

    if (auto err = checkDepth())
    {
        return std::move(err);
    }
    DepthScope scope(*this);

    std::unique_ptr<Object> object = entry->shape->instantiate();
    if (auto* custom = dynamic_cast<CustomDecodable*>(object.get()))
    {
        trace(DecodeTraceKind::ObjectBegin, code, object->typeName());
        if (auto err = custom->decodeCustom(*this))
        {
            return std::move(err);
        }
        return std::move(object);
    }

    if (entry->isEnum)
    {
        trace(DecodeTraceKind::ObjectBegin, code, object->typeName());
        return std::move(object);
    }

    if (auto err = decodeObject(*object, true))
    {
        return withContext(std::move(err), "decode registered object " + object->typeName());
    }
    return std::move(object);
}

llvm::Expected<std::unique_ptr<Object>> decodeRegistered(const llvm::ArrayRef<std::uint8_t> buffer,
                                                         const TypeRegistry&                registry,
                                                         const DecoderOptions&              options)
{
    Reader  reader(buffer);
    Decoder decoder(reader, registry, options);

    auto objectOrErr = decoder.decodeRegistered();
    if (!objectOrErr)
    {
        return decoder.finish(objectOrErr.takeError(), "decode registered object");
    }
    return objectOrErr;
}

}  // namespace tlcodec
