//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestShapes.h"

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Wire/Reader.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace tlcodec::test;

bool checkTypeCode(const tlcodec::TypeRegistry& registry)
{
    const tlcodec::DecoderOptions options;

    {
        WireBuilder wire;
        wire.code(Point::TypeCode).i32(1).i32(2);
        tlcodec::Reader  reader(wire.data());
        tlcodec::Decoder decoder(reader, registry, options);
        Flagged          flagged;
        bool             matched = false;
        llvm::handleAllErrors(decoder.decodeObject(flagged, false),
                              [&matched](const tlcodec::CrcMismatchError& mismatch) {
                                  matched = mismatch.got() == Point::TypeCode && mismatch.want() == Flagged::TypeCode;
                              });
        if (!matched)
        {
            std::cerr << "type code mismatch payload was not reported\n";
            return false;
        }
    }

    {
        const std::vector<std::uint8_t> shortCode = {0x01U, 0x00U};
        tlcodec::Reader                 reader(shortCode);
        tlcodec::Decoder                decoder(reader, registry, options);
        Point                           point;
        llvm::Error                     err = decoder.decodeObject(point, false);
        if (!err.isA<tlcodec::CrcReadError>())
        {
            std::cerr << "short type code was not reported as a crc read failure\n";
            llvm::consumeError(std::move(err));
            return false;
        }
        const std::string message = llvm::toString(std::move(err));
        if (message.find("read crc") != 0U)
        {
            std::cerr << "crc read context mismatch: " << message << "\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.i32(4).i32(5);
        tlcodec::Reader  reader(wire.data());
        tlcodec::Decoder decoder(reader, registry, options);
        Point            point;
        if (auto err = decoder.decodeObject(point, true))
        {
            std::cerr << "bare object decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (point.x != 4 || point.y != 5 || reader.remaining() != 0U)
        {
            std::cerr << "bare object decode mismatch\n";
            return false;
        }
    }
    return true;
}

bool checkOptionalFields(const tlcodec::TypeRegistry& registry)
{
    std::vector<tlcodec::DecodeTraceEvent> events;
    tlcodec::DecoderOptions                options;
    options.traceLevel = tlcodec::TraceLevel::Verbose;
    options.traceSink  = [&events](const tlcodec::DecodeTraceEvent& event) { events.push_back(event); };

    {
        WireBuilder wire;
        wire.code(Flagged::TypeCode).u32(0U).i64(99);
        Flagged flagged;
        if (auto err = tlcodec::decode(wire.data(), &flagged, registry, options))
        {
            std::cerr << "empty bitset decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (flagged.opt != 0 || flagged.present || flagged.tail != 99)
        {
            std::cerr << "empty bitset must skip every optional field\n";
            return false;
        }
        std::size_t skipped = 0U;
        for (const tlcodec::DecodeTraceEvent& event : events)
        {
            if (event.kind == tlcodec::DecodeTraceKind::FieldSkipped)
            {
                ++skipped;
            }
        }
        if (skipped != 2U)
        {
            std::cerr << "expected two skipped fields, got " << skipped << "\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Flagged::TypeCode).u32(1U).i32(-8).i64(3);
        Flagged flagged;
        if (auto err = tlcodec::decode(wire.data(), &flagged, registry))
        {
            std::cerr << "bit 0 decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (flagged.opt != -8 || flagged.present || flagged.tail != 3)
        {
            std::cerr << "bit 0 must read the optional value\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Flagged::TypeCode).u32(4U).i64(11);
        Flagged flagged;
        if (auto err = tlcodec::decode(wire.data(), &flagged, registry))
        {
            std::cerr << "bitflag decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (flagged.opt != 0 || !flagged.present || flagged.tail != 11)
        {
            std::cerr << "bitflag field must be set without consuming bytes\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Flagged::TypeCode).raw({0x01U, 0x00U});
        tlcodec::Reader               reader(wire.data());
        const tlcodec::DecoderOptions quiet;
        tlcodec::Decoder              decoder(reader, registry, quiet);
        Flagged                       flagged;
        llvm::Error                   err = decoder.decodeObject(flagged, false);
        if (!err.isA<tlcodec::BitsetReadError>())
        {
            std::cerr << "short bitset was not reported as a bitset read failure\n";
            llvm::consumeError(std::move(err));
            return false;
        }
        llvm::consumeError(std::move(err));
    }
    return true;
}

bool checkFieldContext(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(Point::TypeCode).i32(1);
    tlcodec::Reader               reader(wire.data());
    const tlcodec::DecoderOptions options;
    tlcodec::Decoder              decoder(reader, registry, options);
    Point                         point;

    bool matched = false;
    llvm::handleAllErrors(decoder.decodeValue(point), [&matched](const tlcodec::TruncatedInputError& truncated) {
        matched = truncated.context().size() == 2U && truncated.context()[0] == "decode point" &&
                  truncated.context()[1] == "decode field 'y'" && truncated.needed() == 4U;
    });
    if (!matched || point.x != 1)
    {
        std::cerr << "field failure context mismatch\n";
        return false;
    }
    if (decoder.depth() != 0U)
    {
        std::cerr << "depth was not restored after a failure\n";
        return false;
    }
    return true;
}

bool checkNestedAllocation(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(Holder::TypeCode).code(Point::TypeCode).i32(6).i32(7);

    {
        Holder holder;
        if (auto err = tlcodec::decode(wire.data(), &holder, registry))
        {
            std::cerr << "holder decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (!holder.point || holder.point->x != 6 || holder.point->y != 7)
        {
            std::cerr << "nested object was not allocated\n";
            return false;
        }
    }

    {
        Holder holder;
        holder.point       = std::make_unique<Point>();
        const Point* reuse = holder.point.get();
        if (auto err = tlcodec::decode(wire.data(), &holder, registry))
        {
            std::cerr << "holder reuse decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (holder.point.get() != reuse || holder.point->y != 7)
        {
            std::cerr << "present nested object must be reused\n";
            return false;
        }
    }

    {
        WireBuilder wrong;
        wrong.code(Holder::TypeCode).code(Cat::TypeCode).i32(9);
        Holder            holder;
        const std::string message = takeMessage(tlcodec::decode(wrong.data(), &holder, registry));
        if (message.find("decode holder: decode field 'point': decode point: invalid crc code: 0x22220001, want: "
                         "0x11110001") == std::string::npos)
        {
            std::cerr << "nested mismatch message: " << message << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

bool runObjectDecoderTests()
{
    auto registryOrErr = buildTestRegistry();
    if (!registryOrErr)
    {
        std::cerr << "test registry failed: " << llvm::toString(registryOrErr.takeError()) << "\n";
        return false;
    }

    bool ok = true;
    ok      = checkTypeCode(*registryOrErr) && ok;
    ok      = checkOptionalFields(*registryOrErr) && ok;
    ok      = checkFieldContext(*registryOrErr) && ok;
    ok      = checkNestedAllocation(*registryOrErr) && ok;
    return ok;
}
