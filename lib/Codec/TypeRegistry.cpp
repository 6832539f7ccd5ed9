//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements registry assembly and lookup.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/TypeRegistry.h"

#include "tlcodec/Support/Errors.h"

namespace tlcodec
{

TypeRegistry::Builder& TypeRegistry::Builder::addShape(const Shape& shape, const bool isEnum)
{
    pending_.push_back(RegisteredType{&shape, isEnum});
    return *this;
}

llvm::Expected<TypeRegistry> TypeRegistry::Builder::build()
{
    TypeRegistry registry;
    for (const RegisteredType& entry : pending_)
    {
        if (auto err = entry.shape->validate())
        {
            return std::move(err);
        }

        const auto [it, inserted] = registry.entries_.emplace(entry.shape->typeCode(), entry);
        if (inserted)
        {
            continue;
        }
        if (it->second.shape != entry.shape)
        {
            return llvm::make_error<DuplicateTypeCodeError>(entry.shape->typeCode(),
                                                            it->second.shape->typeName(),
                                                            entry.shape->typeName());
        }
        it->second.isEnum = it->second.isEnum || entry.isEnum;
    }
    pending_.clear();
    return registry;
}

const RegisteredType* TypeRegistry::lookup(const std::uint32_t code) const
{
    const auto it = entries_.find(code);
    return it != entries_.end() ? &it->second : nullptr;
}

bool TypeRegistry::isEnum(const std::uint32_t code) const
{
    const RegisteredType* entry = lookup(code);
    return entry != nullptr && entry->isEnum;
}

std::unique_ptr<Object> TypeRegistry::instantiate(const std::uint32_t code) const
{
    const RegisteredType* entry = lookup(code);
    return entry != nullptr ? entry->shape->instantiate() : nullptr;
}

}  // namespace tlcodec
