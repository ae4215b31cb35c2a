#include <Trellis/TypeResolver.hpp>
#include <Trellis/TypeBuilder.hpp>

#include <optional>

namespace Trellis
{

  namespace
  {
    using TypeList = NGIN::Containers::Vector<TypeExpr>;

    ExpectedTypeExpr Resolve(const TypeExpr &type, const TypeExpr &context, const Type &declaringType,
                             NGIN::UIntSize depth);

    std::optional<NGIN::UIntSize> SlotOf(const TypeExpr &var, const Type &owner)
    {
      for (NGIN::UIntSize i = 0; i < owner.TypeParameterCount(); ++i)
      {
        if (owner.TypeParameterAt(i) == var)
          return i;
      }
      return std::nullopt;
    }

    TypeList SubstituteList(const TypeList &items, const Type &owner, const TypeExpr &context);

    // Replace owner's type variables with the parallel arguments of a parameterized context
    TypeExpr Substitute(const TypeExpr &type, const Type &owner, const TypeExpr &context)
    {
      if (!context.IsParameterized() || !type.IsValid())
        return type;
      switch (type.Kind())
      {
        case TypeKind::Class:
          return type;
        case TypeKind::Variable:
        {
          if (!(type.DeclaringType() == owner))
            return type;
          auto slot = SlotOf(type, owner);
          if (!slot || *slot >= context.Arguments().Size())
            return type;
          return context.Arguments()[*slot];
        }
        case TypeKind::Parameterized:
          return TypeExpr::Parameterized(type.RawType(), SubstituteList(type.Arguments(), owner, context));
        case TypeKind::Wildcard:
          return TypeExpr::Wildcard(SubstituteList(type.LowerBounds(), owner, context),
                                    SubstituteList(type.UpperBounds(), owner, context));
        case TypeKind::Array:
          return TypeExpr::Array(Substitute(type.ElementType(), owner, context));
      }
      return type;
    }

    TypeList SubstituteList(const TypeList &items, const Type &owner, const TypeExpr &context)
    {
      TypeList out;
      out.Reserve(items.Size());
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
        out.PushBack(Substitute(items[i], owner, context));
      return out;
    }

    ExpectedTypeExpr ResolveVariable(const TypeExpr &var, const TypeExpr &context, const Type &declaringType,
                                     NGIN::UIntSize depth);

    TypeList EraseList(const TypeList &items);

    // Variables left over after substitution were never bound: use their first bound, or the top type
    TypeExpr Erase(const TypeExpr &type)
    {
      if (!type.IsValid())
        return type;
      switch (type.Kind())
      {
        case TypeKind::Class:
          return type;
        case TypeKind::Variable:
        {
          const auto &bounds = type.Bounds();
          return bounds.Size() != 0 ? bounds[0] : TopType();
        }
        case TypeKind::Parameterized:
          return TypeExpr::Parameterized(type.RawType(), EraseList(type.Arguments()));
        case TypeKind::Wildcard:
          return TypeExpr::Wildcard(EraseList(type.LowerBounds()), EraseList(type.UpperBounds()));
        case TypeKind::Array:
          return TypeExpr::Array(Erase(type.ElementType()));
      }
      return type;
    }

    TypeList EraseList(const TypeList &items)
    {
      TypeList out;
      out.Reserve(items.Size());
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
        out.PushBack(Erase(items[i]));
      return out;
    }

    // One supertype edge of clazz. An empty optional means the edge does not bind var.
    std::expected<std::optional<TypeExpr>, Error> ScanSuperType(const TypeExpr &var, const TypeExpr &context,
                                                                const Type &declaringType, const Type &clazz,
                                                                const TypeExpr &declaredEdge, NGIN::UIntSize depth)
    {
      const auto edge = Substitute(declaredEdge, clazz, context);
      const auto parent = edge.RawType();
      if (!parent.IsValid())
        return std::optional<TypeExpr>{};

      if (edge.IsParameterized() && parent == declaringType)
      {
        auto slot = SlotOf(var, declaringType);
        if (!slot || *slot >= edge.Arguments().Size())
          return std::optional<TypeExpr>{};
        return std::optional<TypeExpr>{Erase(edge.Arguments()[*slot])};
      }
      if (declaringType.IsAssignableFrom(parent))
      {
        auto r = ResolveVariable(var, edge, declaringType, depth + 1);
        if (!r)
          return std::unexpected(r.error());
        return std::optional<TypeExpr>{std::move(*r)};
      }
      return std::optional<TypeExpr>{};
    }

    ExpectedTypeExpr ResolveVariable(const TypeExpr &var, const TypeExpr &context, const Type &declaringType,
                                     NGIN::UIntSize depth)
    {
      if (depth > kMaxResolveDepth)
        return TopType();
      if (!context.IsClass() && !context.IsParameterized())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "context must be a class or parameterized type"});

      const auto clazz = context.RawType();
      if (clazz == declaringType)
      {
        if (context.IsParameterized())
        {
          auto slot = SlotOf(var, declaringType);
          if (slot && *slot < context.Arguments().Size())
            return context.Arguments()[*slot];
        }
        const auto &bounds = var.Bounds();
        return bounds.Size() != 0 ? bounds[0] : TopType();
      }

      for (NGIN::UIntSize i = 0; i < clazz.GenericSuperclassCount(); ++i)
      {
        auto r = ScanSuperType(var, context, declaringType, clazz, clazz.GenericSuperclassAt(i), depth);
        if (!r)
          return std::unexpected(r.error());
        if (*r)
          return std::move(**r);
      }
      for (NGIN::UIntSize i = 0; i < clazz.GenericInterfaceCount(); ++i)
      {
        auto r = ScanSuperType(var, context, declaringType, clazz, clazz.GenericInterfaceAt(i), depth);
        if (!r)
          return std::unexpected(r.error());
        if (*r)
          return std::move(**r);
      }
      return TopType();
    }

    std::expected<TypeList, Error> ResolveList(const TypeList &items, const TypeExpr &context,
                                               const Type &declaringType, NGIN::UIntSize depth)
    {
      TypeList out;
      out.Reserve(items.Size());
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
      {
        auto r = Resolve(items[i], context, declaringType, depth);
        if (!r)
          return std::unexpected(r.error());
        out.PushBack(std::move(*r));
      }
      return out;
    }

    ExpectedTypeExpr Resolve(const TypeExpr &type, const TypeExpr &context, const Type &declaringType,
                             NGIN::UIntSize depth)
    {
      if (!type.IsValid())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "declared type is empty"});
      switch (type.Kind())
      {
        case TypeKind::Class:
          return type;
        case TypeKind::Variable:
          return ResolveVariable(type, context, declaringType, depth);
        case TypeKind::Parameterized:
        {
          auto args = ResolveList(type.Arguments(), context, declaringType, depth);
          if (!args)
            return std::unexpected(args.error());
          return TypeExpr::Parameterized(type.RawType(), std::move(*args));
        }
        case TypeKind::Wildcard:
        {
          auto lower = ResolveList(type.LowerBounds(), context, declaringType, depth);
          if (!lower)
            return std::unexpected(lower.error());
          auto upper = ResolveList(type.UpperBounds(), context, declaringType, depth);
          if (!upper)
            return std::unexpected(upper.error());
          return TypeExpr::Wildcard(std::move(*lower), std::move(*upper));
        }
        case TypeKind::Array:
        {
          auto element = Resolve(type.ElementType(), context, declaringType, depth);
          if (!element)
            return std::unexpected(element.error());
          return TypeExpr::Array(std::move(*element));
        }
      }
      return type;
    }
  } // namespace

  ExpectedTypeExpr ResolveType(const TypeExpr &declared, const TypeExpr &context, const Type &declaringType)
  {
    return Resolve(declared, context, declaringType, 0);
  }

  ExpectedTypeExpr ResolveFieldType(const Field &field, const TypeExpr &context)
  {
    if (!field.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    return ResolveType(field.DeclaredType(), context, field.DeclaringType());
  }

  ExpectedTypeExpr ResolveReturnType(const Property &property, const TypeExpr &context)
  {
    if (!property.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    if (!property.CanRead())
      return std::unexpected(Error{ErrorCode::NotFound, "property has no getter"});
    return ResolveType(property.GetterDeclaredType(), context, property.DeclaringType());
  }

  std::expected<NGIN::Containers::Vector<TypeExpr>, Error> ResolveParamTypes(const Property &property,
                                                                             const TypeExpr &context)
  {
    if (!property.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    if (!property.CanWrite())
      return std::unexpected(Error{ErrorCode::NotFound, "property has no setter"});
    NGIN::Containers::Vector<TypeExpr> declared;
    declared.PushBack(property.SetterDeclaredType());
    return ResolveList(declared, context, property.DeclaringType(), 0);
  }

  Type RawTypeOf(const TypeExpr &type)
  {
    if (!type.IsValid())
      return Type{};
    switch (type.Kind())
    {
      case TypeKind::Class:
      case TypeKind::Parameterized:
        return type.RawType();
      case TypeKind::Variable:
        if (type.Bounds().Size() != 0)
          return RawTypeOf(type.Bounds()[0]);
        break;
      case TypeKind::Wildcard:
        if (type.UpperBounds().Size() != 0)
          return RawTypeOf(type.UpperBounds()[0]);
        break;
      case TypeKind::Array:
        break;
    }
    return TopType().RawType();
  }

} // namespace Trellis
