//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shape tables and custom decoders of the MTProto service layer.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Schema/Core.h"

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Codec/JsonDump.h"
#include "tlcodec/Codec/ShapeBuilder.h"
#include "tlcodec/Support/Errors.h"

#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace tlcodec
{
namespace schema
{
namespace
{

/// Decodes `value` and names the field on failure, as the generic traversal does.
template <typename T>
llvm::Error decodeNamed(Decoder& decoder, T& value, llvm::StringRef name)
{
    if (auto err = decoder.decodeValue(value))
    {
        return withContext(std::move(err), "decode field '" + name + "'");
    }
    return llvm::Error::success();
}

/// Reads the count of a bare vector whose elements take at least `minElementSize` bytes.
llvm::Expected<std::uint32_t> readBareCount(Reader& reader, const std::size_t minElementSize)
{
    const std::size_t start   = reader.offset();
    auto              countOrErr = reader.readU32();
    if (!countOrErr)
    {
        return countOrErr.takeError();
    }
    const std::size_t needed = static_cast<std::size_t>(*countOrErr) * minElementSize;
    if (needed > reader.remaining())
    {
        return llvm::make_error<TruncatedInputError>(needed, reader.remaining(), start);
    }
    return *countOrErr;
}

}  // namespace

llvm::Error Int128::decodeCustom(Decoder& decoder)
{
    std::array<std::uint8_t, 16> value{};
    for (std::size_t word = 0; word < value.size() / 4U; ++word)
    {
        auto wordOrErr = decoder.reader().readU32();
        if (!wordOrErr)
        {
            return wordOrErr.takeError();
        }
        for (std::size_t index = 0; index < 4U; ++index)
        {
            value[word * 4U + index] = static_cast<std::uint8_t>(*wordOrErr >> (8U * index));
        }
    }
    bytes = value;
    return llvm::Error::success();
}

llvm::json::Value Int128::dumpJson() const
{
    return bytesToJson(bytes);
}

const Shape& BoolTrue::describe()
{
    static const Shape shape = ShapeBuilder<BoolTrue>().build();
    return shape;
}

const Shape& BoolFalse::describe()
{
    static const Shape shape = ShapeBuilder<BoolFalse>().build();
    return shape;
}

const Shape& ResPq::describe()
{
    static const Shape shape = ShapeBuilder<ResPq>()
                                   .field<&ResPq::nonce>("nonce")
                                   .field<&ResPq::serverNonce>("server_nonce")
                                   .field<&ResPq::pq>("pq")
                                   .field<&ResPq::serverPublicKeyFingerprints>("server_public_key_fingerprints")
                                   .build();
    return shape;
}

const Shape& RpcError::describe()
{
    static const Shape shape = ShapeBuilder<RpcError>()
                                   .field<&RpcError::errorCode>("error_code")
                                   .field<&RpcError::errorMessage>("error_message")
                                   .build();
    return shape;
}

const Shape& RpcResult::describe()
{
    static const Shape shape = ShapeBuilder<RpcResult>()
                                   .field<&RpcResult::reqMsgId>("req_msg_id")
                                   .field<&RpcResult::result>("result")
                                   .build();
    return shape;
}

llvm::Error RpcResult::decodeCustom(Decoder& decoder)
{
    if (auto err = decodeNamed(decoder, reqMsgId, "req_msg_id"))
    {
        return err;
    }
    return decodeNamed(decoder, result, "result");
}

llvm::Error ContainerMessage::decodeCustom(Decoder& decoder)
{
    Reader& reader = decoder.reader();
    if (auto err = decodeNamed(decoder, msgId, "msg_id"))
    {
        return err;
    }
    if (auto err = decodeNamed(decoder, seqno, "seqno"))
    {
        return err;
    }
    if (auto err = decodeNamed(decoder, bytes, "bytes"))
    {
        return err;
    }
    if (bytes > reader.remaining())
    {
        return llvm::make_error<TruncatedInputError>(bytes, reader.remaining(), reader.offset());
    }

    const std::size_t start = reader.offset();
    auto              bodyOrErr = decoder.decodeRegistered();
    if (!bodyOrErr)
    {
        return withContext(bodyOrErr.takeError(), "decode field 'body'");
    }
    body = std::move(*bodyOrErr);

    const std::size_t consumed = reader.offset() - start;
    if (consumed != bytes)
    {
        return llvm::make_error<MalformedInputError>(
            llvm::formatv("message {0} body took {1} bytes, header declares {2}", msgId, consumed, bytes).str());
    }
    return llvm::Error::success();
}

llvm::json::Value ContainerMessage::dumpJson() const
{
    return llvm::json::Object{{"msg_id", msgId},
                              {"seqno", seqno},
                              {"bytes", static_cast<std::int64_t>(bytes)},
                              {"body", body ? toJson(*body) : llvm::json::Value(nullptr)}};
}

const Shape& MsgContainer::describe()
{
    static const Shape shape = ShapeBuilder<MsgContainer>().field<&MsgContainer::messages>("messages").build();
    return shape;
}

llvm::Error MsgContainer::decodeCustom(Decoder& decoder)
{
    auto countOrErr = readBareCount(decoder.reader(), ContainerMessage::HeaderSize + 4U);
    if (!countOrErr)
    {
        return withContext(countOrErr.takeError(), "decode field 'messages'");
    }

    std::vector<ContainerMessage> decoded;
    decoded.reserve(*countOrErr);
    for (std::uint32_t index = 0; index < *countOrErr; ++index)
    {
        ContainerMessage message;
        if (auto err = message.decodeCustom(decoder))
        {
            return withContext(withContext(std::move(err), "decode element #" + llvm::Twine(index)),
                               "decode field 'messages'");
        }
        decoded.push_back(std::move(message));
    }
    messages = std::move(decoded);
    return llvm::Error::success();
}

const Shape& MsgsAck::describe()
{
    static const Shape shape = ShapeBuilder<MsgsAck>().field<&MsgsAck::msgIds>("msg_ids").build();
    return shape;
}

const Shape& Pong::describe()
{
    static const Shape shape =
        ShapeBuilder<Pong>().field<&Pong::msgId>("msg_id").field<&Pong::pingId>("ping_id").build();
    return shape;
}

const Shape& BadMsgNotification::describe()
{
    static const Shape shape = ShapeBuilder<BadMsgNotification>()
                                   .field<&BadMsgNotification::badMsgId>("bad_msg_id")
                                   .field<&BadMsgNotification::badMsgSeqno>("bad_msg_seqno")
                                   .field<&BadMsgNotification::errorCode>("error_code")
                                   .build();
    return shape;
}

const Shape& BadServerSalt::describe()
{
    static const Shape shape = ShapeBuilder<BadServerSalt>()
                                   .field<&BadServerSalt::badMsgId>("bad_msg_id")
                                   .field<&BadServerSalt::badMsgSeqno>("bad_msg_seqno")
                                   .field<&BadServerSalt::errorCode>("error_code")
                                   .field<&BadServerSalt::newServerSalt>("new_server_salt")
                                   .build();
    return shape;
}

const Shape& NewSessionCreated::describe()
{
    static const Shape shape = ShapeBuilder<NewSessionCreated>()
                                   .field<&NewSessionCreated::firstMsgId>("first_msg_id")
                                   .field<&NewSessionCreated::uniqueId>("unique_id")
                                   .field<&NewSessionCreated::serverSalt>("server_salt")
                                   .build();
    return shape;
}

const Shape& FutureSalt::describe()
{
    static const Shape shape = ShapeBuilder<FutureSalt>()
                                   .field<&FutureSalt::validSince>("valid_since")
                                   .field<&FutureSalt::validUntil>("valid_until")
                                   .field<&FutureSalt::salt>("salt")
                                   .build();
    return shape;
}

const Shape& FutureSalts::describe()
{
    static const Shape shape = ShapeBuilder<FutureSalts>()
                                   .field<&FutureSalts::reqMsgId>("req_msg_id")
                                   .field<&FutureSalts::now>("now")
                                   .field<&FutureSalts::salts>("salts")
                                   .build();
    return shape;
}

llvm::Error FutureSalts::decodeCustom(Decoder& decoder)
{
    if (auto err = decodeNamed(decoder, reqMsgId, "req_msg_id"))
    {
        return err;
    }
    if (auto err = decodeNamed(decoder, now, "now"))
    {
        return err;
    }

    // Bare future_salt: 4 + 4 + 8 bytes, no type code.
    auto countOrErr = readBareCount(decoder.reader(), 16U);
    if (!countOrErr)
    {
        return withContext(countOrErr.takeError(), "decode field 'salts'");
    }

    std::vector<FutureSalt> decoded(*countOrErr);
    for (std::uint32_t index = 0; index < *countOrErr; ++index)
    {
        if (auto err = decoder.decodeObject(decoded[index], /*skipTypeCode=*/true))
        {
            return withContext(withContext(std::move(err), "decode element #" + llvm::Twine(index)),
                               "decode field 'salts'");
        }
    }
    salts = std::move(decoded);
    return llvm::Error::success();
}

const Shape& DestroySessionOk::describe()
{
    static const Shape shape =
        ShapeBuilder<DestroySessionOk>().field<&DestroySessionOk::sessionId>("session_id").build();
    return shape;
}

const Shape& DestroySessionNone::describe()
{
    static const Shape shape =
        ShapeBuilder<DestroySessionNone>().field<&DestroySessionNone::sessionId>("session_id").build();
    return shape;
}

const Shape& HttpWait::describe()
{
    static const Shape shape = ShapeBuilder<HttpWait>()
                                   .field<&HttpWait::maxDelay>("max_delay")
                                   .field<&HttpWait::waitAfter>("wait_after")
                                   .field<&HttpWait::maxWait>("max_wait")
                                   .build();
    return shape;
}

const Shape& MsgDetailedInfo::describe()
{
    static const Shape shape = ShapeBuilder<MsgDetailedInfo>()
                                   .field<&MsgDetailedInfo::msgId>("msg_id")
                                   .field<&MsgDetailedInfo::answerMsgId>("answer_msg_id")
                                   .field<&MsgDetailedInfo::bytes>("bytes")
                                   .field<&MsgDetailedInfo::status>("status")
                                   .build();
    return shape;
}

const Shape& MsgNewDetailedInfo::describe()
{
    static const Shape shape = ShapeBuilder<MsgNewDetailedInfo>()
                                   .field<&MsgNewDetailedInfo::answerMsgId>("answer_msg_id")
                                   .field<&MsgNewDetailedInfo::bytes>("bytes")
                                   .field<&MsgNewDetailedInfo::status>("status")
                                   .build();
    return shape;
}

const Shape& PhotoEmpty::describe()
{
    static const Shape shape = ShapeBuilder<PhotoEmpty>().field<&PhotoEmpty::id>("id").build();
    return shape;
}

const Shape& MessageMediaEmpty::describe()
{
    static const Shape shape = ShapeBuilder<MessageMediaEmpty>().build();
    return shape;
}

const Shape& MessageMediaPhoto::describe()
{
    static const Shape shape = ShapeBuilder<MessageMediaPhoto>()
                                   .flag<&MessageMediaPhoto::spoiler>("spoiler", 3U)
                                   .optional<&MessageMediaPhoto::photo>("photo", 0U)
                                   .optional<&MessageMediaPhoto::ttlSeconds>("ttl_seconds", 2U)
                                   .build();
    return shape;
}

void registerCoreTypes(TypeRegistry::Builder& builder)
{
    builder.addEnum<BoolTrue>()
        .addEnum<BoolFalse>()
        .add<ResPq>()
        .add<RpcError>()
        .add<RpcResult>()
        .add<MsgContainer>()
        .add<MsgsAck>()
        .add<Pong>()
        .add<BadMsgNotification>()
        .add<BadServerSalt>()
        .add<NewSessionCreated>()
        .add<FutureSalt>()
        .add<FutureSalts>()
        .add<DestroySessionOk>()
        .add<DestroySessionNone>()
        .add<HttpWait>()
        .add<MsgDetailedInfo>()
        .add<MsgNewDetailedInfo>()
        .add<PhotoEmpty>()
        .add<MessageMediaEmpty>()
        .add<MessageMediaPhoto>();
}

llvm::Expected<TypeRegistry> buildCoreRegistry()
{
    TypeRegistry::Builder builder;
    registerCoreTypes(builder);
    return builder.build();
}

}  // namespace schema
}  // namespace tlcodec
