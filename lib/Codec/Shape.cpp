//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shape field tables and their declaration checks.
///
//===----------------------------------------------------------------------===//

#include "tlcodec/Codec/Shape.h"

#include "tlcodec/Support/Errors.h"

#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace tlcodec
{

Shape::Shape(const std::uint32_t typeCode, const llvm::StringRef typeName, const ObjectFactoryFn factory)
    : typeCode_(typeCode)
    , typeName_(typeName.str())
    , factory_(factory)
{
}

void Shape::addField(FieldDescriptor field)
{
    if (defect_.empty())
    {
        if (findField(field.name) != nullptr)
        {
            defect_ = llvm::formatv("duplicate field '{0}'", field.name).str();
        }
        else if (field.flag && field.flag->bitIndex >= BitsetWidth)
        {
            defect_ = llvm::formatv("field '{0}' uses bit {1}, bitset has {2} bits",
                                    field.name,
                                    static_cast<unsigned>(field.flag->bitIndex),
                                    static_cast<unsigned>(BitsetWidth))
                          .str();
        }
        else if (field.flag && field.flag->isBitflagValued && field.setPresent == nullptr)
        {
            defect_ = llvm::formatv("bitflag field '{0}' has no presence setter", field.name).str();
        }
    }

    hasOptionalFields_ = hasOptionalFields_ || field.flag.has_value();
    fields_.push_back(std::move(field));
}

std::unique_ptr<Object> Shape::instantiate() const
{
    return factory_ != nullptr ? factory_() : nullptr;
}

llvm::Error Shape::validate() const
{
    if (factory_ == nullptr)
    {
        return llvm::make_error<ShapeError>(llvm::formatv("shape '{0}' has no factory", typeName_).str());
    }
    if (!defect_.empty())
    {
        return llvm::make_error<ShapeError>(llvm::formatv("shape '{0}': {1}", typeName_, defect_).str());
    }
    return llvm::Error::success();
}

const FieldDescriptor* Shape::findField(const llvm::StringRef name) const
{
    for (const FieldDescriptor& field : fields_)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

}  // namespace tlcodec
