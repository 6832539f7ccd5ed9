//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the codec error payloads and context annotation helpers.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Support/Errors.h"

#include "llvm/Support/FormatVariadic.h"

#include <memory>
#include <utility>

namespace tlcodec
{

char DecodeError::ID            = 0;
char InvalidTargetError::ID     = 0;
char CrcMismatchError::ID       = 0;
char CrcReadError::ID           = 0;
char BitsetReadError::ID        = 0;
char UnknownTypeError::ID       = 0;
char UnsupportedShapeError::ID  = 0;
char TruncatedInputError::ID    = 0;
char MalformedInputError::ID    = 0;
char UnexpectedVariantError::ID = 0;
char DepthLimitError::ID        = 0;
char DuplicateTypeCodeError::ID = 0;
char ShapeError::ID             = 0;
char ExternalError::ID          = 0;

llvm::StringRef errorKindName(const DecodeErrorKind kind)
{
    switch (kind)
    {
    case DecodeErrorKind::InvalidTarget:
        return "invalid-target";
    case DecodeErrorKind::CrcMismatch:
        return "crc-mismatch";
    case DecodeErrorKind::CrcRead:
        return "crc-read";
    case DecodeErrorKind::BitsetRead:
        return "bitset-read";
    case DecodeErrorKind::UnknownType:
        return "unknown-type";
    case DecodeErrorKind::UnsupportedShape:
        return "unsupported-shape";
    case DecodeErrorKind::TruncatedInput:
        return "truncated-input";
    case DecodeErrorKind::MalformedInput:
        return "malformed-input";
    case DecodeErrorKind::UnexpectedVariant:
        return "unexpected-variant";
    case DecodeErrorKind::DepthLimit:
        return "depth-limit";
    case DecodeErrorKind::DuplicateTypeCode:
        return "duplicate-type-code";
    case DecodeErrorKind::Shape:
        return "shape";
    case DecodeErrorKind::External:
        return "external";
    }
    return "unknown";
}

std::string formatTypeCode(const std::uint32_t code)
{
    return llvm::formatv("{0:x8}", code).str();
}

DecodeError::DecodeError(const DecodeErrorKind kind, std::string message)
    : kind_(kind)
    , message_(std::move(message))
{
}

void DecodeError::addContext(std::string entry)
{
    context_.insert(context_.begin(), std::move(entry));
}

void DecodeError::log(llvm::raw_ostream& os) const
{
    for (const std::string& entry : context_)
    {
        os << entry << ": ";
    }
    os << message_;
}

std::error_code DecodeError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

InvalidTargetError::InvalidTargetError(std::string reason)
    : ErrorInfo(DecodeErrorKind::InvalidTarget, std::move(reason))
{
}

CrcMismatchError::CrcMismatchError(const std::uint32_t got, const std::uint32_t want)
    : ErrorInfo(DecodeErrorKind::CrcMismatch,
                llvm::formatv("invalid crc code: {0}, want: {1}", formatTypeCode(got), formatTypeCode(want)).str())
    , got_(got)
    , want_(want)
{
}

CrcReadError::CrcReadError(std::string cause)
    : ErrorInfo(DecodeErrorKind::CrcRead, std::move(cause))
{
}

BitsetReadError::BitsetReadError(std::string cause)
    : ErrorInfo(DecodeErrorKind::BitsetRead, std::move(cause))
{
}

UnknownTypeError::UnknownTypeError(const std::uint32_t code, std::vector<std::uint8_t> remainder)
    : ErrorInfo(DecodeErrorKind::UnknownType,
                llvm::formatv("object with provided crc not registered: {0} ({1} unread bytes)",
                              formatTypeCode(code),
                              remainder.size())
                    .str())
    , code_(code)
    , remainder_(std::move(remainder))
{
}

UnsupportedShapeError::UnsupportedShapeError(const llvm::StringRef kindName, const llvm::StringRef detail)
    : ErrorInfo(DecodeErrorKind::UnsupportedShape, llvm::formatv("unsupported kind '{0}': {1}", kindName, detail).str())
    , kindName_(kindName.str())
{
}

TruncatedInputError::TruncatedInputError(const std::size_t needed, const std::size_t available, const std::size_t offset)
    : ErrorInfo(DecodeErrorKind::TruncatedInput,
                llvm::formatv("unexpected end of input: need {0} bytes, {1} available at offset {2}",
                              needed,
                              available,
                              offset)
                    .str())
    , needed_(needed)
    , available_(available)
    , offset_(offset)
{
}

MalformedInputError::MalformedInputError(std::string reason)
    : ErrorInfo(DecodeErrorKind::MalformedInput, std::move(reason))
{
}

UnexpectedVariantError::UnexpectedVariantError(const std::uint32_t    code,
                                               const llvm::StringRef typeName,
                                               const llvm::StringRef expected)
    : ErrorInfo(DecodeErrorKind::UnexpectedVariant,
                llvm::formatv("registered object {0} ({1}) is not {2}", typeName, formatTypeCode(code), expected).str())
    , code_(code)
{
}

DepthLimitError::DepthLimitError(const std::uint32_t limit)
    : ErrorInfo(DecodeErrorKind::DepthLimit, llvm::formatv("object nesting exceeds depth limit {0}", limit).str())
    , limit_(limit)
{
}

DuplicateTypeCodeError::DuplicateTypeCodeError(const std::uint32_t    code,
                                               const llvm::StringRef first,
                                               const llvm::StringRef second)
    : ErrorInfo(DecodeErrorKind::DuplicateTypeCode,
                llvm::formatv("type code {0} registered for both '{1}' and '{2}'", formatTypeCode(code), first, second)
                    .str())
    , code_(code)
{
}

ShapeError::ShapeError(std::string reason)
    : ErrorInfo(DecodeErrorKind::Shape, std::move(reason))
{
}

ExternalError::ExternalError(std::string message)
    : ErrorInfo(DecodeErrorKind::External, std::move(message))
{
}

llvm::Error withContext(llvm::Error err, const llvm::Twine& context)
{
    if (!err)
    {
        return llvm::Error::success();
    }
    std::string entry = context.str();
    return llvm::handleErrors(
        std::move(err),
        [&entry](std::unique_ptr<DecodeError> payload) -> llvm::Error {
            payload->addContext(std::move(entry));
            return llvm::Error(std::move(payload));
        },
        [&entry](std::unique_ptr<llvm::ErrorInfoBase> payload) -> llvm::Error {
            auto wrapped = std::make_unique<ExternalError>(payload->message());
            wrapped->addContext(std::move(entry));
            return llvm::Error(std::move(wrapped));
        });
}

DecodeErrorKind errorKind(const llvm::Error& err)
{
    if (err.isA<InvalidTargetError>())
    {
        return DecodeErrorKind::InvalidTarget;
    }
    if (err.isA<CrcMismatchError>())
    {
        return DecodeErrorKind::CrcMismatch;
    }
    if (err.isA<CrcReadError>())
    {
        return DecodeErrorKind::CrcRead;
    }
    if (err.isA<BitsetReadError>())
    {
        return DecodeErrorKind::BitsetRead;
    }
    if (err.isA<UnknownTypeError>())
    {
        return DecodeErrorKind::UnknownType;
    }
    if (err.isA<UnsupportedShapeError>())
    {
        return DecodeErrorKind::UnsupportedShape;
    }
    if (err.isA<TruncatedInputError>())
    {
        return DecodeErrorKind::TruncatedInput;
    }
    if (err.isA<MalformedInputError>())
    {
        return DecodeErrorKind::MalformedInput;
    }
    if (err.isA<UnexpectedVariantError>())
    {
        return DecodeErrorKind::UnexpectedVariant;
    }
    if (err.isA<DepthLimitError>())
    {
        return DecodeErrorKind::DepthLimit;
    }
    if (err.isA<DuplicateTypeCodeError>())
    {
        return DecodeErrorKind::DuplicateTypeCode;
    }
    if (err.isA<ShapeError>())
    {
        return DecodeErrorKind::Shape;
    }
    return DecodeErrorKind::External;
}

}  // namespace tlcodec
