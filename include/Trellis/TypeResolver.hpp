// TypeResolver.hpp
// Resolves generically declared member types against an instantiation context
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/TypeExpr.hpp>
#include <Trellis/Registry.hpp>

namespace Trellis
{

  // Supertype chains deeper than this resolve to the top type
  inline constexpr NGIN::UIntSize kMaxResolveDepth = 64;

  // Substitute every type variable reachable from `declared` as seen from `context`.
  //
  // `context` is the concrete type through which the member is accessed: a class
  // expression or a parameterized expression. `declaringType` is the type that
  // declared the member. Variables that cannot be bound fall back to their first
  // bound, or the top type. The only failure is an unusable context, reported as
  // ErrorCode::InvalidArgument, and only once a variable actually needs it.
  [[nodiscard]] TRELLIS_API ExpectedTypeExpr ResolveType(const TypeExpr &declared, const TypeExpr &context,
                                                         const Type &declaringType);

  [[nodiscard]] TRELLIS_API ExpectedTypeExpr ResolveFieldType(const Field &field, const TypeExpr &context);
  [[nodiscard]] TRELLIS_API ExpectedTypeExpr ResolveReturnType(const Property &property, const TypeExpr &context);
  [[nodiscard]] TRELLIS_API std::expected<NGIN::Containers::Vector<TypeExpr>, Error>
  ResolveParamTypes(const Property &property, const TypeExpr &context);

  // Concrete registered type a resolved expression stands for. Variables and
  // wildcards use their first bound; arrays and unbounded cases give the top type.
  [[nodiscard]] TRELLIS_API Type RawTypeOf(const TypeExpr &type);

} // namespace Trellis
