//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements primitive Type Language wire reads.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Wire/Reader.h"

#include "llvm/Support/FormatVariadic.h"

#include <cstring>

namespace tlcodec
{

Reader::Reader(const llvm::ArrayRef<std::uint8_t> buffer)
    : buffer_(buffer)
{
}

llvm::Error Reader::require(const std::size_t count) const
{
    const std::size_t available = remaining();
    if (count > available)
    {
        return llvm::make_error<TruncatedInputError>(count, available, offset_);
    }
    return llvm::Error::success();
}

std::uint64_t Reader::loadLittleEndian(const std::size_t width) const
{
    std::uint64_t value = 0U;
    for (std::size_t i = 0; i < width; ++i)
    {
        value |= static_cast<std::uint64_t>(buffer_[offset_ + i]) << (8U * i);
    }
    return value;
}

llvm::Expected<std::uint32_t> Reader::readU32()
{
    if (auto err = require(4U))
    {
        return std::move(err);
    }
    const auto value = static_cast<std::uint32_t>(loadLittleEndian(4U));
    offset_ += 4U;
    return value;
}

llvm::Expected<std::int64_t> Reader::readI64()
{
    if (auto err = require(8U))
    {
        return std::move(err);
    }
    const auto value = static_cast<std::int64_t>(loadLittleEndian(8U));
    offset_ += 8U;
    return value;
}

llvm::Expected<double> Reader::readF64()
{
    if (auto err = require(8U))
    {
        return std::move(err);
    }
    const std::uint64_t bits  = loadLittleEndian(8U);
    double              value = 0.0;
    static_assert(sizeof(value) == sizeof(bits), "double must be 64 bits wide");
    std::memcpy(&value, &bits, sizeof(value));
    offset_ += 8U;
    return value;
}

llvm::Expected<bool> Reader::readBool()
{
    if (auto err = require(4U))
    {
        return std::move(err);
    }
    const auto code = static_cast<std::uint32_t>(loadLittleEndian(4U));
    if (code != wire::BoolTrueCode && code != wire::BoolFalseCode)
    {
        return llvm::make_error<MalformedInputError>(
            llvm::formatv("expected boolean type code at offset {0}, got {1}", offset_, formatTypeCode(code)).str());
    }
    offset_ += 4U;
    return code == wire::BoolTrueCode;
}

llvm::Expected<std::uint32_t> Reader::readTypeCode()
{
    return readU32();
}

llvm::Expected<std::vector<std::uint8_t>> Reader::readByteMessage()
{
    if (auto err = require(1U))
    {
        return std::move(err);
    }

    const std::uint8_t first      = buffer_[offset_];
    std::size_t        headerSize = 1U;
    std::size_t        length     = first;
    if (first == wire::LongLengthMarker)
    {
        if (auto err = require(4U))
        {
            return std::move(err);
        }
        headerSize = 4U;
        length     = static_cast<std::size_t>(loadLittleEndian(4U) >> 8U);
    }
    else if (first > wire::LongLengthMarker)
    {
        return llvm::make_error<MalformedInputError>(
            llvm::formatv("invalid byte string length marker {0} at offset {1}", first, offset_).str());
    }

    const std::size_t total  = headerSize + length;
    const std::size_t padded = (total + 3U) & ~static_cast<std::size_t>(3U);
    if (auto err = require(padded))
    {
        return std::move(err);
    }

    const auto* begin = buffer_.data() + offset_ + headerSize;
    std::vector<std::uint8_t> payload(begin, begin + length);
    offset_ += padded;
    return payload;
}

llvm::Expected<std::string> Reader::readString()
{
    auto bytesOrErr = readByteMessage();
    if (!bytesOrErr)
    {
        return bytesOrErr.takeError();
    }
    return std::string(bytesOrErr->begin(), bytesOrErr->end());
}

llvm::Expected<std::uint32_t> Reader::readVectorHeader()
{
    const std::size_t start = offset_;
    auto              crcOrErr = readTypeCode();
    if (!crcOrErr)
    {
        return withContext(crcOrErr.takeError(), "read vector crc");
    }
    if (*crcOrErr != wire::VectorCode)
    {
        offset_ = start;
        return llvm::make_error<CrcMismatchError>(*crcOrErr, wire::VectorCode);
    }

    auto countOrErr = readU32();
    if (!countOrErr)
    {
        offset_ = start;
        return withContext(countOrErr.takeError(), "read vector length");
    }

    const std::size_t count = *countOrErr;
    if (count > remaining() / wire::MinElementSize)
    {
        const std::size_t available = remaining();
        offset_                     = start;
        return withContext(llvm::make_error<TruncatedInputError>(count * wire::MinElementSize, available, start + 8U),
                           "vector of " + llvm::Twine(count) + " elements");
    }
    return *countOrErr;
}

llvm::Expected<std::vector<std::uint8_t>> Reader::readRemainderWithoutConsuming() const
{
    if (offset_ > buffer_.size())
    {
        return llvm::make_error<MalformedInputError>(
            llvm::formatv("reader offset {0} is past the buffer end {1}", offset_, buffer_.size()).str());
    }
    return std::vector<std::uint8_t>(buffer_.begin() + offset_, buffer_.end());
}

}  // namespace tlcodec
