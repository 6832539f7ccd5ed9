//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// MTProto service-layer shapes.
///
/// These are the constructors a client sees wrapped around every RPC answer
/// (containers, acknowledgements, salts, session notifications) plus the boxed
/// booleans and one flagged media shape. `registerCoreTypes` adds all of them
/// to a registry builder.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_SCHEMA_CORE_H
#define TLCODEC_SCHEMA_CORE_H

#include "tlcodec/Codec/Object.h"
#include "tlcodec/Codec/TypeRegistry.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tlcodec
{
namespace schema
{

/// @brief 128-bit nonce, stored in wire byte order.
struct Int128 final : public CustomDecodable
{
    std::array<std::uint8_t, 16> bytes{};

    llvm::Error       decodeCustom(Decoder& decoder) override;
    llvm::json::Value dumpJson() const override;
};

//===----------------------------------------------------------------------===//
// Polymorphic families.
//===----------------------------------------------------------------------===//

class BoolType : public Object
{};

class BadMsgNotificationType : public Object
{};

class DestroySessionResType : public Object
{};

class MsgDetailedInfoType : public Object
{};

class PhotoType : public Object
{};

class MessageMediaType : public Object
{};

//===----------------------------------------------------------------------===//
// Constructors.
//===----------------------------------------------------------------------===//

struct BoolTrue final : public ObjectBase<BoolTrue, BoolType>
{
    static constexpr std::uint32_t      TypeCode = 0x997275b5U;
    static constexpr llvm::StringLiteral TypeName{"boolTrue"};
    static const Shape&                 describe();
};

struct BoolFalse final : public ObjectBase<BoolFalse, BoolType>
{
    static constexpr std::uint32_t      TypeCode = 0xbc799737U;
    static constexpr llvm::StringLiteral TypeName{"boolFalse"};
    static const Shape&                 describe();
};

struct ResPq final : public ObjectBase<ResPq>
{
    static constexpr std::uint32_t      TypeCode = 0x05162463U;
    static constexpr llvm::StringLiteral TypeName{"resPQ"};
    static const Shape&                 describe();

    Int128                    nonce;
    Int128                    serverNonce;
    std::vector<std::uint8_t> pq;
    std::vector<std::int64_t> serverPublicKeyFingerprints;
};

struct RpcError final : public ObjectBase<RpcError>
{
    static constexpr std::uint32_t      TypeCode = 0x2144ca19U;
    static constexpr llvm::StringLiteral TypeName{"rpc_error"};
    static const Shape&                 describe();

    std::int32_t errorCode{0};
    std::string  errorMessage;
};

/// @brief Answer to one request; the result is any registered object.
struct RpcResult final : public ObjectBase<RpcResult>, public CustomDecodable
{
    static constexpr std::uint32_t      TypeCode = 0xf35c6d01U;
    static constexpr llvm::StringLiteral TypeName{"rpc_result"};
    static const Shape&                 describe();

    llvm::Error decodeCustom(Decoder& decoder) override;

    std::int64_t            reqMsgId{0};
    std::unique_ptr<Object> result;
};

/// @brief One message inside a container; the body length is carried explicitly.
struct ContainerMessage final : public CustomDecodable
{
    /// @brief Encoded size of the fixed header (msg_id, seqno, bytes).
    static constexpr std::size_t HeaderSize = 16U;

    llvm::Error       decodeCustom(Decoder& decoder) override;
    llvm::json::Value dumpJson() const override;

    std::int64_t            msgId{0};
    std::int32_t            seqno{0};
    std::uint32_t           bytes{0};
    std::unique_ptr<Object> body;
};

/// @brief Batch of messages, encoded as a bare vector of `message`.
struct MsgContainer final : public ObjectBase<MsgContainer>, public CustomDecodable
{
    static constexpr std::uint32_t      TypeCode = 0x73f1f8dcU;
    static constexpr llvm::StringLiteral TypeName{"msg_container"};
    static const Shape&                 describe();

    llvm::Error decodeCustom(Decoder& decoder) override;

    std::vector<ContainerMessage> messages;
};

struct MsgsAck final : public ObjectBase<MsgsAck>
{
    static constexpr std::uint32_t      TypeCode = 0x62d6b459U;
    static constexpr llvm::StringLiteral TypeName{"msgs_ack"};
    static const Shape&                 describe();

    std::vector<std::int64_t> msgIds;
};

struct Pong final : public ObjectBase<Pong>
{
    static constexpr std::uint32_t      TypeCode = 0x347773c5U;
    static constexpr llvm::StringLiteral TypeName{"pong"};
    static const Shape&                 describe();

    std::int64_t msgId{0};
    std::int64_t pingId{0};
};

struct BadMsgNotification final : public ObjectBase<BadMsgNotification, BadMsgNotificationType>
{
    static constexpr std::uint32_t      TypeCode = 0xa7eff811U;
    static constexpr llvm::StringLiteral TypeName{"bad_msg_notification"};
    static const Shape&                 describe();

    std::int64_t badMsgId{0};
    std::int32_t badMsgSeqno{0};
    std::int32_t errorCode{0};
};

struct BadServerSalt final : public ObjectBase<BadServerSalt, BadMsgNotificationType>
{
    static constexpr std::uint32_t      TypeCode = 0xedab447bU;
    static constexpr llvm::StringLiteral TypeName{"bad_server_salt"};
    static const Shape&                 describe();

    std::int64_t badMsgId{0};
    std::int32_t badMsgSeqno{0};
    std::int32_t errorCode{0};
    std::int64_t newServerSalt{0};
};

struct NewSessionCreated final : public ObjectBase<NewSessionCreated>
{
    static constexpr std::uint32_t      TypeCode = 0x9ec20908U;
    static constexpr llvm::StringLiteral TypeName{"new_session_created"};
    static const Shape&                 describe();

    std::int64_t firstMsgId{0};
    std::int64_t uniqueId{0};
    std::int64_t serverSalt{0};
};

struct FutureSalt final : public ObjectBase<FutureSalt>
{
    static constexpr std::uint32_t      TypeCode = 0x0949d9dcU;
    static constexpr llvm::StringLiteral TypeName{"future_salt"};
    static const Shape&                 describe();

    std::int32_t validSince{0};
    std::int32_t validUntil{0};
    std::int64_t salt{0};
};

/// @brief Salt schedule; `salts` is a bare vector of bare `future_salt`.
struct FutureSalts final : public ObjectBase<FutureSalts>, public CustomDecodable
{
    static constexpr std::uint32_t      TypeCode = 0xae500895U;
    static constexpr llvm::StringLiteral TypeName{"future_salts"};
    static const Shape&                 describe();

    llvm::Error decodeCustom(Decoder& decoder) override;

    std::int64_t            reqMsgId{0};
    std::int32_t            now{0};
    std::vector<FutureSalt> salts;
};

struct DestroySessionOk final : public ObjectBase<DestroySessionOk, DestroySessionResType>
{
    static constexpr std::uint32_t      TypeCode = 0xe22045fcU;
    static constexpr llvm::StringLiteral TypeName{"destroy_session_ok"};
    static const Shape&                 describe();

    std::int64_t sessionId{0};
};

struct DestroySessionNone final : public ObjectBase<DestroySessionNone, DestroySessionResType>
{
    static constexpr std::uint32_t      TypeCode = 0x62d350c9U;
    static constexpr llvm::StringLiteral TypeName{"destroy_session_none"};
    static const Shape&                 describe();

    std::int64_t sessionId{0};
};

struct HttpWait final : public ObjectBase<HttpWait>
{
    static constexpr std::uint32_t      TypeCode = 0x9299359fU;
    static constexpr llvm::StringLiteral TypeName{"http_wait"};
    static const Shape&                 describe();

    std::int32_t maxDelay{0};
    std::int32_t waitAfter{0};
    std::int32_t maxWait{0};
};

struct MsgDetailedInfo final : public ObjectBase<MsgDetailedInfo, MsgDetailedInfoType>
{
    static constexpr std::uint32_t      TypeCode = 0x276d3ec6U;
    static constexpr llvm::StringLiteral TypeName{"msg_detailed_info"};
    static const Shape&                 describe();

    std::int64_t msgId{0};
    std::int64_t answerMsgId{0};
    std::int32_t bytes{0};
    std::int32_t status{0};
};

struct MsgNewDetailedInfo final : public ObjectBase<MsgNewDetailedInfo, MsgDetailedInfoType>
{
    static constexpr std::uint32_t      TypeCode = 0x809db6dfU;
    static constexpr llvm::StringLiteral TypeName{"msg_new_detailed_info"};
    static const Shape&                 describe();

    std::int64_t answerMsgId{0};
    std::int32_t bytes{0};
    std::int32_t status{0};
};

struct PhotoEmpty final : public ObjectBase<PhotoEmpty, PhotoType>
{
    static constexpr std::uint32_t      TypeCode = 0x2331b22dU;
    static constexpr llvm::StringLiteral TypeName{"photoEmpty"};
    static const Shape&                 describe();

    std::int64_t id{0};
};

struct MessageMediaEmpty final : public ObjectBase<MessageMediaEmpty, MessageMediaType>
{
    static constexpr std::uint32_t      TypeCode = 0x3ded6320U;
    static constexpr llvm::StringLiteral TypeName{"messageMediaEmpty"};
    static const Shape&                 describe();
};

/// @brief Media with optional photo (bit 0), TTL (bit 2) and spoiler flag (bit 3).
struct MessageMediaPhoto final : public ObjectBase<MessageMediaPhoto, MessageMediaType>
{
    static constexpr std::uint32_t      TypeCode = 0x695150d7U;
    static constexpr llvm::StringLiteral TypeName{"messageMediaPhoto"};
    static const Shape&                 describe();

    bool                       spoiler{false};
    std::unique_ptr<PhotoType> photo;
    std::int32_t               ttlSeconds{0};
};

/// @brief Adds every shape of this header to `builder`.
void registerCoreTypes(TypeRegistry::Builder& builder);

/// @brief Builds a registry holding only the core shapes.
llvm::Expected<TypeRegistry> buildCoreRegistry();

}  // namespace schema
}  // namespace tlcodec

#endif  // TLCODEC_SCHEMA_CORE_H
