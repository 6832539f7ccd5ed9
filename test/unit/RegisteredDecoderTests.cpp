//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestShapes.h"

#include "tlcodec/Codec/Decoder.h"
#include "tlcodec/Support/Trace.h"
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

/// Builds `count` nested links; only the innermost one leaves bit 0 unset.
WireBuilder linkChain(const std::uint32_t count)
{
    WireBuilder wire;
    for (std::uint32_t i = 0; i < count; ++i)
    {
        wire.code(Link::TypeCode).u32(i + 1U < count ? 1U : 0U);
    }
    return wire;
}

bool checkUnknownType(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(0xcafebabeU).u32(1U).u32(2U);

    {
        std::vector<tlcodec::DecodeTraceEvent> events;
        tlcodec::DecoderOptions                options;
        options.traceLevel = tlcodec::TraceLevel::Basic;
        options.traceSink  = [&events](const tlcodec::DecodeTraceEvent& event) { events.push_back(event); };

        auto objectOrErr = tlcodec::decodeRegistered(wire.data(), registry, options);
        if (objectOrErr)
        {
            std::cerr << "unknown type code was resolved\n";
            return false;
        }
        bool matched = false;
        llvm::handleAllErrors(objectOrErr.takeError(), [&matched](const tlcodec::UnknownTypeError& unknown) {
            matched = unknown.code() == 0xcafebabeU && unknown.remainder().size() == 8U &&
                      unknown.remainder().front() == 1U && unknown.context().front() == "decode registered object";
        });
        if (!matched)
        {
            std::cerr << "unknown type payload mismatch\n";
            return false;
        }
        if (events.size() != 2U || events[0].kind != tlcodec::DecodeTraceKind::UnknownType ||
            events[0].typeCode != 0xcafebabeU || events[1].kind != tlcodec::DecodeTraceKind::DecodeFailed)
        {
            std::cerr << "unknown type trace mismatch\n";
            return false;
        }
    }

    {
        tlcodec::DecoderOptions options;
        options.captureUnknownRemainder = false;
        auto objectOrErr                = tlcodec::decodeRegistered(wire.data(), registry, options);
        if (objectOrErr)
        {
            std::cerr << "unknown type code was resolved without capture\n";
            return false;
        }
        bool matched = false;
        llvm::handleAllErrors(objectOrErr.takeError(), [&matched](const tlcodec::UnknownTypeError& unknown) {
            matched = unknown.remainder().empty();
        });
        if (!matched)
        {
            std::cerr << "remainder must stay empty when capture is disabled\n";
            return false;
        }
    }

    {
        auto objectOrErr = tlcodec::decodeRegistered(llvm::ArrayRef<std::uint8_t>(), registry);
        if (objectOrErr || takeKind(objectOrErr.takeError()) != tlcodec::DecodeErrorKind::CrcRead)
        {
            std::cerr << "empty buffer must fail with a crc read error\n";
            return false;
        }
    }
    return true;
}

bool checkEnumAndCustom(const tlcodec::TypeRegistry& registry)
{
    {
        WireBuilder wire;
        wire.code(Red::TypeCode).u32(5U);
        tlcodec::Reader               reader(wire.data());
        const tlcodec::DecoderOptions options;
        tlcodec::Decoder              decoder(reader, registry, options);
        auto                          objectOrErr = decoder.decodeRegistered();
        if (!objectOrErr)
        {
            std::cerr << "enum variant decode failed: " << llvm::toString(objectOrErr.takeError()) << "\n";
            return false;
        }
        if ((*objectOrErr)->typeCode() != Red::TypeCode || reader.offset() != 4U)
        {
            std::cerr << "enum variant must consume only its type code\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Note::TypeCode).string("hi");
        auto objectOrErr = tlcodec::decodeRegistered(wire.data(), registry);
        if (!objectOrErr)
        {
            std::cerr << "registered custom decode failed: " << llvm::toString(objectOrErr.takeError()) << "\n";
            return false;
        }
        const auto* note = dynamic_cast<const Note*>(objectOrErr->get());
        if (note == nullptr || note->text != "hi" || note->calls != 1)
        {
            std::cerr << "registered custom object must decode itself once\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Note::TypeCode).string("direct");
        Note note;
        if (auto err = tlcodec::decode(wire.data(), &note, registry))
        {
            std::cerr << "direct custom object decode failed: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (note.text != "direct" || note.calls != 1)
        {
            std::cerr << "direct custom object mismatch\n";
            return false;
        }
    }

    {
        WireBuilder wire;
        wire.code(Point::TypeCode).i32(1);
        const std::string message = takeMessage(tlcodec::decodeRegistered(wire.data(), registry).takeError());
        if (message.find("decode registered object: decode registered object point: decode field 'y'") != 0U)
        {
            std::cerr << "registered field failure context mismatch: " << message << "\n";
            return false;
        }
    }
    return true;
}

bool checkPolymorphicFields(const tlcodec::TypeRegistry& registry)
{
    WireBuilder wire;
    wire.code(Zoo::TypeCode)
        .vectorHeader(2U)
        .code(Cat::TypeCode)
        .i32(9)
        .code(Dog::TypeCode)
        .string("rex")
        .code(Cat::TypeCode)
        .i32(3)
        .code(Blue::TypeCode)
        .code(Point::TypeCode)
        .i32(1)
        .i32(2);

    Zoo zoo;
    if (auto err = tlcodec::decode(wire.data(), &zoo, registry))
    {
        std::cerr << "zoo decode failed: " << llvm::toString(std::move(err)) << "\n";
        return false;
    }
    if (zoo.animals.size() != 2U)
    {
        std::cerr << "zoo animal count mismatch\n";
        return false;
    }
    const auto* cat = dynamic_cast<const Cat*>(zoo.animals[0].get());
    const auto* dog = dynamic_cast<const Dog*>(zoo.animals[1].get());
    if (cat == nullptr || cat->lives != 9 || dog == nullptr || dog->name != "rex")
    {
        std::cerr << "zoo animals decoded out of order\n";
        return false;
    }
    if (zoo.favourite.get<Cat>() == nullptr || zoo.favourite.get<Cat>()->lives != 3)
    {
        std::cerr << "zoo favourite mismatch\n";
        return false;
    }
    if (dynamic_cast<const Blue*>(zoo.colour.get()) == nullptr)
    {
        std::cerr << "zoo colour mismatch\n";
        return false;
    }
    const auto* point = dynamic_cast<const Point*>(zoo.anything.get());
    if (point == nullptr || point->x != 1 || point->y != 2)
    {
        std::cerr << "zoo open-ended member mismatch\n";
        return false;
    }

    {
        WireBuilder stray;
        stray.code(Zoo::TypeCode).vectorHeader(0U).code(Dog::TypeCode).string("fido");
        Zoo  other;
        bool matched = false;
        llvm::handleAllErrors(tlcodec::decode(stray.data(), &other, registry),
                              [&matched](const tlcodec::UnexpectedVariantError& unexpected) {
                                  matched = unexpected.code() == Dog::TypeCode &&
                                            unexpected.message().find("decode field 'favourite'") !=
                                                std::string::npos &&
                                            unexpected.message().find("one of {cat}") != std::string::npos;
                              });
        if (!matched)
        {
            std::cerr << "closed variant set admitted a stray shape\n";
            return false;
        }
    }

    {
        WireBuilder stray;
        stray.code(Zoo::TypeCode).vectorHeader(0U).code(Cat::TypeCode).i32(1).code(Cat::TypeCode).i32(2);
        Zoo other;
        if (takeKind(tlcodec::decode(stray.data(), &other, registry)) != tlcodec::DecodeErrorKind::UnexpectedVariant)
        {
            std::cerr << "family member admitted a shape from another family\n";
            return false;
        }
    }
    return true;
}

bool checkDepthLimit(const tlcodec::TypeRegistry& registry)
{
    tlcodec::DecoderOptions options;
    options.maxDepth = 3U;

    {
        auto objectOrErr = tlcodec::decodeRegistered(linkChain(3U).data(), registry, options);
        if (!objectOrErr)
        {
            std::cerr << "chain within the limit failed: " << llvm::toString(objectOrErr.takeError()) << "\n";
            return false;
        }
        const auto* head = dynamic_cast<const Link*>(objectOrErr->get());
        if (head == nullptr || head->next == nullptr)
        {
            std::cerr << "chain head mismatch\n";
            return false;
        }
    }

    {
        auto objectOrErr = tlcodec::decodeRegistered(linkChain(4U).data(), registry, options);
        if (objectOrErr)
        {
            std::cerr << "chain past the limit was accepted\n";
            return false;
        }
        bool matched = false;
        llvm::handleAllErrors(objectOrErr.takeError(), [&matched](const tlcodec::DepthLimitError& limit) {
            matched = limit.limit() == 3U;
        });
        if (!matched)
        {
            std::cerr << "depth limit payload mismatch\n";
            return false;
        }
    }

    {
        options.maxDepth = 0U;
        auto objectOrErr = tlcodec::decodeRegistered(linkChain(200U).data(), registry, options);
        if (!objectOrErr)
        {
            std::cerr << "unbounded chain failed: " << llvm::toString(objectOrErr.takeError()) << "\n";
            return false;
        }
    }

    {
        tlcodec::DecoderOptions tight;
        tight.maxDepth = 1U;
        WireBuilder wire;
        wire.code(Holder::TypeCode).code(Point::TypeCode).i32(1).i32(2);
        Holder holder;
        if (takeKind(tlcodec::decode(wire.data(), &holder, registry, tight)) != tlcodec::DecodeErrorKind::DepthLimit)
        {
            std::cerr << "nested concrete object ignored the depth limit\n";
            return false;
        }
    }
    return true;
}

}  // namespace

bool runRegisteredDecoderTests()
{
    auto registryOrErr = buildTestRegistry();
    if (!registryOrErr)
    {
        std::cerr << "test registry failed: " << llvm::toString(registryOrErr.takeError()) << "\n";
        return false;
    }

    bool ok = true;
    ok      = checkUnknownType(*registryOrErr) && ok;
    ok      = checkEnumAndCustom(*registryOrErr) && ok;
    ok      = checkPolymorphicFields(*registryOrErr) && ok;
    ok      = checkDepthLimit(*registryOrErr) && ok;
    return ok;
}
