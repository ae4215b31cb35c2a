#pragma once

#include <string_view>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/Registry.hpp>
#include <Trellis/TypeBuilder.hpp>
#include <Trellis/TypeExpr.hpp>
#include <Trellis/TypeResolver.hpp>
#include <Trellis/PropertyTokenizer.hpp>
#include <Trellis/ObjectRef.hpp>
#include <Trellis/MetadataCache.hpp>
#include <Trellis/MetaClass.hpp>
#include <Trellis/ObjectFactory.hpp>
#include <Trellis/ObjectWrapper.hpp>
#include <Trellis/MetaObject.hpp>
#include <Trellis/GenericTokenParser.hpp>
#include <NGIN/Meta/TypeName.hpp>

namespace Trellis
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Trellis"; }

} // namespace Trellis
