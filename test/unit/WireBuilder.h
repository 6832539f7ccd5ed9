//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Little-endian payload builder for unit tests.
///
//===----------------------------------------------------------------------===//
#ifndef TLCODEC_TEST_WIRE_BUILDER_H
#define TLCODEC_TEST_WIRE_BUILDER_H

#include "tlcodec/Wire/Reader.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <cstring>
#include <vector>

namespace tlcodec
{
namespace test
{

class WireBuilder final
{
public:
    WireBuilder& u32(const std::uint32_t value)
    {
        append(value, 4U);
        return *this;
    }

    WireBuilder& i32(const std::int32_t value)
    {
        return u32(static_cast<std::uint32_t>(value));
    }

    WireBuilder& code(const std::uint32_t value)
    {
        return u32(value);
    }

    WireBuilder& i64(const std::int64_t value)
    {
        append(static_cast<std::uint64_t>(value), 8U);
        return *this;
    }

    WireBuilder& f64(const double value)
    {
        std::uint64_t bits = 0U;
        std::memcpy(&bits, &value, sizeof(bits));
        append(bits, 8U);
        return *this;
    }

    WireBuilder& boolean(const bool value)
    {
        return u32(value ? wire::BoolTrueCode : wire::BoolFalseCode);
    }

    /// Appends a TL byte string with its length prefix and zero padding.
    WireBuilder& bytes(llvm::ArrayRef<std::uint8_t> payload)
    {
        std::size_t header = 1U;
        if (payload.size() < wire::LongLengthMarker)
        {
            bytes_.push_back(static_cast<std::uint8_t>(payload.size()));
        }
        else
        {
            header = 4U;
            bytes_.push_back(wire::LongLengthMarker);
            append(payload.size(), 3U);
        }
        bytes_.insert(bytes_.end(), payload.begin(), payload.end());
        for (std::size_t total = header + payload.size(); total % 4U != 0U; ++total)
        {
            bytes_.push_back(0U);
        }
        return *this;
    }

    WireBuilder& string(llvm::StringRef text)
    {
        return bytes(llvm::ArrayRef<std::uint8_t>(text.bytes_begin(), text.bytes_end()));
    }

    WireBuilder& vectorHeader(const std::uint32_t count)
    {
        return code(wire::VectorCode).u32(count);
    }

    WireBuilder& raw(llvm::ArrayRef<std::uint8_t> payload)
    {
        bytes_.insert(bytes_.end(), payload.begin(), payload.end());
        return *this;
    }

    WireBuilder& append(const WireBuilder& other)
    {
        return raw(other.data());
    }

    [[nodiscard]] const std::vector<std::uint8_t>& data() const
    {
        return bytes_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return bytes_.size();
    }

private:
    void append(const std::uint64_t value, const std::size_t width)
    {
        for (std::size_t i = 0; i < width; ++i)
        {
            bytes_.push_back(static_cast<std::uint8_t>(value >> (8U * i)));
        }
    }

    std::vector<std::uint8_t> bytes_;
};

}  // namespace test
}  // namespace tlcodec

#endif  // TLCODEC_TEST_WIRE_BUILDER_H
