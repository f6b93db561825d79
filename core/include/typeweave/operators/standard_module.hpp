// typeweave/operators/standard_module.hpp - Default operator set
#pragma once

#include "typeweave/dispatch/module.hpp"

namespace typeweave
{

/// Name of the module returned by standard_module().
inline constexpr const char * kStandardModuleName = "standard";

/**
 * The standard operators: Size, GetElementType, ImmutableCheck, NopConverter,
 * ConvertingCopier and BeanCopier.
 *
 * CopyingConverter and PropertyCopier are configured per type and are added
 * by the caller.
 */
[[nodiscard]] Module standard_module(TypeContext & types);

}  // namespace typeweave
