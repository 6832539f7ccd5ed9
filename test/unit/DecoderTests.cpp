//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestShapes.h"

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Support/DecoderConfig.h"
#include "tlcodec/Support/Trace.h"

#include "llvm/Support/Error.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

using namespace tlcodec::test;

bool checkTopLevelTargets(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(Point::TypeCode).i32(1).i32(2);

    std::vector<tlcodec::DecodeTraceEvent> events;
    tlcodec::DecoderOptions                options;
    options.traceLevel = tlcodec::TraceLevel::Verbose;
    options.traceSink  = [&events](const tlcodec::DecodeTraceEvent& event) { events.push_back(event); };

    Point* missing = nullptr;
    if (takeKind(tlcodec::decode(wire.data(), missing, registry, options)) != tlcodec::DecodeErrorKind::InvalidTarget)
    {
        std::cerr << "null pointer target was accepted\n";
        return false;
    }
    if (takeKind(tlcodec::decode(wire.data(), nullptr, registry, options)) != tlcodec::DecodeErrorKind::InvalidTarget)
    {
        std::cerr << "nullptr target was accepted\n";
        return false;
    }

    Point byValue;
    const std::string message = takeMessage(tlcodec::decode(wire.data(), byValue, registry, options));
    if (message.find("is not a pointer as expected") == std::string::npos || byValue.x != 0)
    {
        std::cerr << "non-pointer target mismatch: " << message << "\n";
        return false;
    }

    const Point frozen;
    if (takeKind(tlcodec::decode(wire.data(), &frozen, registry, options)) != tlcodec::DecodeErrorKind::InvalidTarget)
    {
        std::cerr << "const target was accepted\n";
        return false;
    }

    if (!events.empty())
    {
        std::cerr << "invalid targets must fail before the decoder starts\n";
        return false;
    }

    Point point;
    if (auto err = tlcodec::decode(wire.data(), &point, registry, options))
    {
        std::cerr << "point decode failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (point.x != 1 || point.y != 2 || events.empty() || events.front().kind != tlcodec::DecodeTraceKind::ObjectBegin)
    {
        std::cerr << "point decode mismatch\n";
        return false;
    }
    return true;
}

bool checkAllKinds(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(Everything::TypeCode)
        .f64(2.25)
        .i64(-5)
        .u32(0xfffffffeU)
        .i32(-7)
        .boolean(true)
        .string("tl")
        .bytes({1U, 2U, 3U})
        .vectorHeader(3U)
        .i32(3)
        .i32(1)
        .i32(2)
        .u32(7U)
        .i64(42)
        .vectorHeader(3U)
        .boolean(true)
        .boolean(false)
        .boolean(true);

    Everything value;
    if (auto err = tlcodec::decode(wire.data(), &value, registry))
    {
        std::cerr << "all-kinds decode failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (value.real != 2.25 || value.wide != -5 || value.unsignedValue != 0xfffffffeU || value.signedValue != -7 ||
        !value.truth || value.text != "tl")
    {
        std::cerr << "all-kinds scalar mismatch\n";
        return false;
    }
    if (value.blob != std::vector<std::uint8_t>{1U, 2U, 3U} || value.numbers != std::vector<std::int32_t>{3, 1, 2})
    {
        std::cerr << "all-kinds sequence mismatch\n";
        return false;
    }
    if (value.mode != Mode::Active || !value.boxed || *value.boxed != 42 ||
        value.switches != std::vector<bool>{true, false, true})
    {
        std::cerr << "all-kinds enum, indirection or bool vector mismatch\n";
        return false;
    }
    return true;
}

bool checkPrimitiveTargets(const tlcodec::TypeRegistry& registry)
{
    {
        WireBuilder wire;
        wire.i32(-3);
        std::int32_t value = 0;
        if (auto err = tlcodec::decode(wire.data(), &value, registry))
        {
            std::cerr << "int32 decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (value != -3)
        {
            std::cerr << "int32 narrowing mismatch\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.vectorHeader(3U);
        for (std::int32_t i = 0; i < 3; ++i)
        {
            wire.code(Point::TypeCode).i32(i).i32(-i);
        }
        std::vector<std::unique_ptr<Point>> points;
        if (auto err = tlcodec::decode(wire.data(), &points, registry))
        {
            std::cerr << "object vector decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (points.size() != 3U)
        {
            std::cerr << "object vector size mismatch\n";
            return false;
        }
        for (std::int32_t i = 0; i < 3; ++i)
        {
            if (!points[i] || points[i]->x != i || points[i]->y != -i)
            {
                std::cerr << "object vector order mismatch at " << i << "\n";
                return false;
            }
        }
    }

    {
        WireBuilder wire;
        wire.i32(9);
        std::unique_ptr<std::int32_t> boxed;
        if (auto err = tlcodec::decode(wire.data(), &boxed, registry))
        {
            std::cerr << "indirection decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (!boxed || *boxed != 9)
        {
            std::cerr << "indirection was not allocated and filled\n";
            return false;
        }
    }

    {
        std::vector<std::int32_t> values = {5, 6};
        WireBuilder               truncated;
        truncated.vectorHeader(2U).i32(1);
        if (takeKind(tlcodec::decode(truncated.data(), &values, registry)) != tlcodec::DecodeErrorKind::TruncatedInput)
        {
            std::cerr << "truncated vector was accepted\n";
            return false;
        }
        if (values != std::vector<std::int32_t>{5, 6})
        {
            std::cerr << "failed vector decode must leave the target unchanged\n";
            return false;
        }
    }
    return true;
}

bool checkCustomValues(const tlcodec::TypeRegistry& registry)
{
    {
        WireBuilder wire;
        wire.u32(5U);
        Counter counter;
        if (auto err = tlcodec::decode(wire.data(), &counter, registry))
        {
            std::cerr << "custom value decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (counter.calls != 1 || counter.value != 5U)
        {
            std::cerr << "custom decoder must run exactly once\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.u32(0xdeadU);
        Counter counter;
        bool    matched = false;
        llvm::handleAllErrors(tlcodec::decode(wire.data(), &counter, registry),
                              [&matched](const tlcodec::MalformedInputError& malformed) {
                                  matched = malformed.baseMessage() == "counter rejected 0xdead" &&
                                            malformed.context().size() == 1U;
                              });
        if (!matched)
        {
            std::cerr << "custom decoder error was not propagated verbatim\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.vectorHeader(2U).u32(1U).u32(2U);
        std::vector<Counter> counters;
        if (auto err = tlcodec::decode(wire.data(), &counters, registry))
        {
            std::cerr << "custom vector decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (counters.size() != 2U || counters[0].value != 1U || counters[1].value != 2U)
        {
            std::cerr << "custom vector mismatch\n";
            return false;
        }
    }
    return true;
}

bool checkUnsupportedKinds(const tlcodec::TypeRegistry& registry)
{
    {
        WireBuilder wire;
        wire.code(Narrow::TypeCode).i32(1).u32(2U);
        Narrow narrow;
        bool   matched = false;
        llvm::handleAllErrors(tlcodec::decode(wire.data(), &narrow, registry),
                              [&matched](const tlcodec::UnsupportedShapeError& unsupported) {
                                  matched = unsupported.kindName() == "integer" &&
                                            unsupported.message().find("decode field 'narrow_value'") !=
                                                std::string::npos;
                              });
        if (!matched || narrow.ok != 1)
        {
            std::cerr << "narrow integer field was not rejected by kind\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Mapped::TypeCode).u32(0U);
        Mapped mapped;
        if (takeKind(tlcodec::decode(wire.data(), &mapped, registry)) != tlcodec::DecodeErrorKind::UnsupportedShape)
        {
            std::cerr << "map field was not rejected\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.vectorHeader(1U).u32(0U);
        std::vector<float> floats;
        if (takeKind(tlcodec::decode(wire.data(), &floats, registry)) != tlcodec::DecodeErrorKind::UnsupportedShape)
        {
            std::cerr << "float vector was not rejected\n";
            return false;
        }
    }
    return true;
}

}  // namespace

bool runDecoderTests()
{
    auto registryOrErr = buildTestRegistry();
    if (!registryOrErr)
    {
        std::cerr << "test registry failed: " << llvm::toString(registryOrErr.takeError()) << "\n";
        return false;
    }

    bool ok = true;
    ok      = checkTopLevelTargets(*registryOrErr) && ok;
    ok      = checkAllKinds(*registryOrErr) && ok;
    ok      = checkPrimitiveTargets(*registryOrErr) && ok;
    ok      = checkCustomValues(*registryOrErr) && ok;
    ok      = checkUnsupportedKinds(*registryOrErr) && ok;
    return ok;
}
