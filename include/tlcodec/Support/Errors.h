//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy shared by the wire reader, the type registry and the decoder.
///
/// Every failure is an `llvm::ErrorInfo` payload derived from `DecodeError`.
/// Payloads carry a context trail that grows while the error unwinds through
/// nested objects, so the rendered message reads outermost-first while the
/// concrete payload type (and its structured fields) stays inspectable.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_SUPPORT_ERRORS_H
#define TLCODEC_SUPPORT_ERRORS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace tlcodec
{

/// @brief Closed set of failure categories reported by the codec.
enum class DecodeErrorKind
{
    /// @brief Caller passed an absent, immutable or non-pointer target.
    InvalidTarget,

    /// @brief Leading type code differs from the target shape code.
    CrcMismatch,

    /// @brief Type code could not be read from the stream.
    CrcRead,

    /// @brief Optional-field bitset could not be read from the stream.
    BitsetRead,

    /// @brief Type code is not present in the type registry.
    UnknownType,

    /// @brief Target shape requests a value kind the codec does not decode.
    UnsupportedShape,

    /// @brief Stream ended before a read could complete.
    TruncatedInput,

    /// @brief Stream bytes violate the wire format.
    MalformedInput,

    /// @brief Registered object resolved to a shape the target cannot hold.
    UnexpectedVariant,

    /// @brief Object nesting exceeded the configured depth limit.
    DepthLimit,

    /// @brief Two distinct shapes were registered under one type code.
    DuplicateTypeCode,

    /// @brief Shape table declaration is inconsistent.
    Shape,

    /// @brief Foreign `llvm::Error` wrapped with decode context.
    External,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name used in diagnostics.
llvm::StringRef errorKindName(DecodeErrorKind kind);

/// @brief Base payload of every codec error.
class DecodeError : public llvm::ErrorInfo<DecodeError>
{
public:
    /// @brief LLVM RTTI anchor.
    static char ID;

    /// @brief Creates a payload.
    /// @param[in] kind Failure category.
    /// @param[in] message Base message without context.
    DecodeError(DecodeErrorKind kind, std::string message);

    /// @brief Returns the failure category.
    [[nodiscard]] DecodeErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Returns the base message without the context trail.
    [[nodiscard]] const std::string& baseMessage() const
    {
        return message_;
    }

    /// @brief Returns context entries, outermost first.
    [[nodiscard]] const std::vector<std::string>& context() const
    {
        return context_;
    }

    /// @brief Prepends an outer context entry.
    /// @param[in] entry Context text such as `decode field 'id'`.
    void addContext(std::string entry);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

private:
    DecodeErrorKind          kind_;
    std::string              message_;
    std::vector<std::string> context_;
};

/// @brief Target handle was absent or not updatable in place.
class InvalidTargetError final : public llvm::ErrorInfo<InvalidTargetError, DecodeError>
{
public:
    static char ID;

    explicit InvalidTargetError(std::string reason);
};

/// @brief Leading type code did not match the expected shape.
class CrcMismatchError final : public llvm::ErrorInfo<CrcMismatchError, DecodeError>
{
public:
    static char ID;

    /// @param[in] got Type code read from the stream.
    /// @param[in] want Type code declared by the target shape.
    CrcMismatchError(std::uint32_t got, std::uint32_t want);

    [[nodiscard]] std::uint32_t got() const
    {
        return got_;
    }

    [[nodiscard]] std::uint32_t want() const
    {
        return want_;
    }

private:
    std::uint32_t got_;
    std::uint32_t want_;
};

/// @brief Type code read failed; the cause message is kept as the base message.
class CrcReadError final : public llvm::ErrorInfo<CrcReadError, DecodeError>
{
public:
    static char ID;

    explicit CrcReadError(std::string cause);
};

/// @brief Optional-field bitset read failed.
class BitsetReadError final : public llvm::ErrorInfo<BitsetReadError, DecodeError>
{
public:
    static char ID;

    explicit BitsetReadError(std::string cause);
};

/// @brief Registry has no shape for a type code.
///
/// Carries the unread remainder of the buffer (possibly empty when the
/// diagnostic dump was disabled or could not be taken) so callers can log or
/// skip the payload.
class UnknownTypeError final : public llvm::ErrorInfo<UnknownTypeError, DecodeError>
{
public:
    static char ID;

    UnknownTypeError(std::uint32_t code, std::vector<std::uint8_t> remainder);

    [[nodiscard]] std::uint32_t code() const
    {
        return code_;
    }

    [[nodiscard]] const std::vector<std::uint8_t>& remainder() const
    {
        return remainder_;
    }

private:
    std::uint32_t             code_;
    std::vector<std::uint8_t> remainder_;
};

/// @brief Target value kind is outside the decodable set.
class UnsupportedShapeError final : public llvm::ErrorInfo<UnsupportedShapeError, DecodeError>
{
public:
    static char ID;

    /// @param[in] kindName Name of the offending value kind.
    /// @param[in] detail Explanation of the accepted alternative.
    UnsupportedShapeError(llvm::StringRef kindName, llvm::StringRef detail);

    [[nodiscard]] const std::string& kindName() const
    {
        return kindName_;
    }

private:
    std::string kindName_;
};

/// @brief Fixed-width or length-delimited read ran past the buffer end.
class TruncatedInputError final : public llvm::ErrorInfo<TruncatedInputError, DecodeError>
{
public:
    static char ID;

    TruncatedInputError(std::size_t needed, std::size_t available, std::size_t offset);

    [[nodiscard]] std::size_t needed() const
    {
        return needed_;
    }

    [[nodiscard]] std::size_t available() const
    {
        return available_;
    }

    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

private:
    std::size_t needed_;
    std::size_t available_;
    std::size_t offset_;
};

/// @brief Stream content violates the wire format.
class MalformedInputError final : public llvm::ErrorInfo<MalformedInputError, DecodeError>
{
public:
    static char ID;

    explicit MalformedInputError(std::string reason);
};

/// @brief Registry resolved a shape that the polymorphic target does not admit.
class UnexpectedVariantError final : public llvm::ErrorInfo<UnexpectedVariantError, DecodeError>
{
public:
    static char ID;

    /// @param[in] code Resolved type code.
    /// @param[in] typeName Resolved shape name.
    /// @param[in] expected Human-readable description of the admissible set.
    UnexpectedVariantError(std::uint32_t code, llvm::StringRef typeName, llvm::StringRef expected);

    [[nodiscard]] std::uint32_t code() const
    {
        return code_;
    }

private:
    std::uint32_t code_;
};

/// @brief Object nesting went deeper than `DecoderOptions::maxDepth`.
class DepthLimitError final : public llvm::ErrorInfo<DepthLimitError, DecodeError>
{
public:
    static char ID;

    explicit DepthLimitError(std::uint32_t limit);

    [[nodiscard]] std::uint32_t limit() const
    {
        return limit_;
    }

private:
    std::uint32_t limit_;
};

/// @brief Two distinct shapes claim one type code.
class DuplicateTypeCodeError final : public llvm::ErrorInfo<DuplicateTypeCodeError, DecodeError>
{
public:
    static char ID;

    DuplicateTypeCodeError(std::uint32_t code, llvm::StringRef first, llvm::StringRef second);

    [[nodiscard]] std::uint32_t code() const
    {
        return code_;
    }

private:
    std::uint32_t code_;
};

/// @brief Shape table declaration is inconsistent (bad bit index, duplicate field).
class ShapeError final : public llvm::ErrorInfo<ShapeError, DecodeError>
{
public:
    static char ID;

    explicit ShapeError(std::string reason);
};

/// @brief Foreign error that had to pick up decode context.
class ExternalError final : public llvm::ErrorInfo<ExternalError, DecodeError>
{
public:
    static char ID;

    explicit ExternalError(std::string message);
};

/// @brief Prepends a context entry to an error, keeping its payload type.
///
/// Success passes through unchanged. Payloads that are not `DecodeError`s are
/// converted into `ExternalError` carrying their rendered message.
///
/// @param[in] err Error to annotate.
/// @param[in] context Context entry.
/// @return Annotated error.
llvm::Error withContext(llvm::Error err, const llvm::Twine& context);

/// @brief Classifies an error without consuming it.
/// @param[in] err Failure value (must not be success).
/// @return Payload kind, `External` for foreign payloads.
DecodeErrorKind errorKind(const llvm::Error& err);

/// @brief Formats a type code as `0x%08x`.
std::string formatTypeCode(std::uint32_t code);

}  // namespace tlcodec

#endif  // TLCODEC_SUPPORT_ERRORS_H
