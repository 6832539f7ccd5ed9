//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Primitive reader over a Type Language wire buffer.
///
/// The reader is a forward cursor over an immutable byte range. Fixed-width
/// reads are little-endian; byte strings are length-prefixed and padded to a
/// four-byte boundary; vectors carry their own type code and element count.
/// A fixed-width or byte-string read that fails leaves the cursor unchanged.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_WIRE_READER_H
#define TLCODEC_WIRE_READER_H

#include "tlcodec/Support/Errors.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tlcodec
{
namespace wire
{

/// @brief Type code of the boxed `boolTrue` constructor.
inline constexpr std::uint32_t BoolTrueCode = 0x997275b5U;

/// @brief Type code of the boxed `boolFalse` constructor.
inline constexpr std::uint32_t BoolFalseCode = 0xbc799737U;

/// @brief Type code prefixed to every boxed vector.
inline constexpr std::uint32_t VectorCode = 0x1cb5c415U;

/// @brief First byte announcing a three-byte byte-string length.
inline constexpr std::uint8_t LongLengthMarker = 254U;

/// @brief Smallest encoded size of any vector element.
inline constexpr std::size_t MinElementSize = 4U;

}  // namespace wire

/// @brief Stateful cursor over one immutable input buffer.
class Reader final
{
public:
    /// @brief Creates a reader positioned at the buffer start.
    /// @param[in] buffer Input bytes; must outlive the reader.
    explicit Reader(llvm::ArrayRef<std::uint8_t> buffer);

    /// @brief Reads a 32-bit unsigned integer.
    llvm::Expected<std::uint32_t> readU32();

    /// @brief Reads a 64-bit signed integer.
    llvm::Expected<std::int64_t> readI64();

    /// @brief Reads a 64-bit IEEE-754 double.
    llvm::Expected<double> readF64();

    /// @brief Reads a boxed boolean (`boolTrue`/`boolFalse` type code).
    llvm::Expected<bool> readBool();

    /// @brief Reads a 4-byte type code.
    llvm::Expected<std::uint32_t> readTypeCode();

    /// @brief Reads a length-delimited byte string.
    llvm::Expected<std::vector<std::uint8_t>> readByteMessage();

    /// @brief Reads a length-delimited byte string as text.
    llvm::Expected<std::string> readString();

    /// @brief Reads a boxed vector header and returns the element count.
    ///
    /// Fails when the vector type code is wrong or when the count cannot fit
    /// in the remaining bytes.
    llvm::Expected<std::uint32_t> readVectorHeader();

    /// @brief Reads a boxed vector, decoding each element with `decodeElement`.
    ///
    /// @param[out] out Destination; replaced only when every element decodes.
    /// @param[in] decodeElement Callable `llvm::Error(T&)` invoked per element.
    /// @return First failure, annotated with the element index.
    template <typename T, typename ElementDecoder>
    llvm::Error readVector(std::vector<T>& out, ElementDecoder&& decodeElement)
    {
        auto countOrErr = readVectorHeader();
        if (!countOrErr)
        {
            return countOrErr.takeError();
        }

        std::vector<T> elements;
        elements.reserve(*countOrErr);
        for (std::size_t index = 0; index < *countOrErr; ++index)
        {
            T element{};
            if (auto err = decodeElement(element))
            {
                return withContext(std::move(err), "decode element #" + llvm::Twine(index));
            }
            elements.push_back(std::move(element));
        }
        out = std::move(elements);
        return llvm::Error::success();
    }

    /// @brief Copies the unread bytes without moving the cursor.
    llvm::Expected<std::vector<std::uint8_t>> readRemainderWithoutConsuming() const;

    /// @brief Returns the cursor position in bytes.
    [[nodiscard]] std::size_t offset() const
    {
        return offset_;
    }

    /// @brief Returns the number of unread bytes.
    [[nodiscard]] std::size_t remaining() const
    {
        return offset_ <= buffer_.size() ? buffer_.size() - offset_ : 0U;
    }

    /// @brief Returns the total buffer size.
    [[nodiscard]] std::size_t size() const
    {
        return buffer_.size();
    }

private:
    /// @brief Verifies that `count` bytes are available.
    llvm::Error require(std::size_t count) const;

    /// @brief Reads `width` bytes little-endian without bounds checking.
    std::uint64_t loadLittleEndian(std::size_t width) const;

    llvm::ArrayRef<std::uint8_t> buffer_;
    std::size_t                  offset_{0};
};

}  // namespace tlcodec

#endif  // TLCODEC_WIRE_READER_H
