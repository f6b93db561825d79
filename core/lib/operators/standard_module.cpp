// typeweave/operators/standard_module.cpp - Default operator set
//
#include "typeweave/operators/standard_module.hpp"

#include <memory>

#include "typeweave/operators/converters.hpp"
#include "typeweave/operators/copiers.hpp"
#include "typeweave/operators/element_type_operators.hpp"
#include "typeweave/operators/immutable_checker.hpp"
#include "typeweave/operators/size_operators.hpp"

namespace typeweave
{

Module standard_module(TypeContext & types)
{
  Module module(kStandardModuleName);
  module.add(std::make_shared<SizeOfCollection>(types))
    .add(std::make_shared<SizeOfIterable>(types))
    .add(std::make_shared<SizeOfIterator>(types))
    .add(std::make_shared<SizeOfArray>(types))
    .add(std::make_shared<GetArrayElementType>(types))
    .add(std::make_shared<GetIterableElementType>(types))
    .add(std::make_shared<GetMapElementType>(types))
    .add(std::make_shared<DefaultImmutableChecker>(types))
    .add(std::make_shared<NopConverter>(types))
    .add(std::make_shared<ConvertingCopier>(types))
    .add(std::make_shared<BeanCopier>(types));
  return module;
}

}  // namespace typeweave
