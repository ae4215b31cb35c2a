#include <Trellis/MetaClass.hpp>
#include <Trellis/PropertyTokenizer.hpp>
#include <Trellis/TypeResolver.hpp>

namespace Trellis
{

  namespace
  {
    // Type selected by an index into a value of the given resolved type
    TypeExpr IndexedType(const TypeExpr &resolved)
    {
      if (resolved.IsArray())
        return resolved.ElementType();
      const auto raw = RawTypeOf(resolved);
      const auto shape = raw.IsValid() ? raw.GetShape() : Shape::Bean;
      if (shape != Shape::Sequence && shape != Shape::Map)
        return resolved;

      const auto &args = resolved.Arguments();
      if (shape == Shape::Sequence && args.Size() == 1)
        return args[0];
      if (shape == Shape::Map && args.Size() != 0)
        return args[args.Size() - 1];
      const auto element = raw.ElementType();
      return element.IsValid() ? TypeExpr::Class(element) : TopType();
    }

    // Context a child MetaClass sees: pointer-like members are looked through
    TypeExpr ChildContext(const TypeExpr &type)
    {
      const auto raw = RawTypeOf(type);
      if (raw.IsValid() && raw.GetShape() == Shape::Pointer && raw.ElementType().IsValid())
        return TypeExpr::Class(raw.ElementType());
      if (type.IsClass() || type.IsParameterized())
        return type;
      return TypeExpr::Class(raw);
    }
  } // namespace

  MetaClass MetaClass::ForType(const Type &type, MetadataCache &cache)
  {
    return MetaClass{type.IsValid() ? TypeExpr::Class(type) : TypeExpr{}, cache.FindForType(type), &cache};
  }

  MetaClass MetaClass::ForContext(const TypeExpr &context, MetadataCache &cache)
  {
    if (context.IsClass() || context.IsParameterized())
      return MetaClass{context, cache.FindForType(context.RawType()), &cache};
    return ForType(RawTypeOf(context), cache);
  }

  ExpectedTypeExpr MetaClass::SegmentType(const PropertyTokenizer &prop, bool setter) const
  {
    const auto *accessor = setter ? m_metadata->FindSetter(prop.Name()) : m_metadata->FindGetter(prop.Name());
    if (accessor == nullptr)
      return std::unexpected(Error{ErrorCode::NotFound, setter ? "no setter for property" : "no getter for property"});

    TypeExpr resolved = accessor->declaredType;
    if (m_context.IsValid())
    {
      auto r = ResolveType(accessor->declaredType, m_context, accessor->DeclaringType());
      if (!r)
        return std::unexpected(r.error());
      resolved = std::move(*r);
    }
    if (!prop.HasIndex())
      return resolved;
    return IndexedType(resolved);
  }

  std::expected<MetaClass, Error> MetaClass::ForSegment(const PropertyTokenizer &prop) const
  {
    auto type = SegmentType(prop, false);
    if (!type)
      return std::unexpected(type.error());
    return ForContext(ChildContext(*type), *m_cache);
  }

  std::expected<MetaClass, Error> MetaClass::MetaClassForProperty(std::string_view name) const
  {
    PropertyTokenizer prop{name};
    auto child = ForSegment(prop);
    if (!child || !prop.HasNext())
      return child;
    return child->MetaClassForProperty(prop.Children());
  }

  std::optional<std::string> MetaClass::FindProperty(std::string_view name, bool useCamelCaseMapping) const
  {
    std::string path;
    if (useCamelCaseMapping)
    {
      for (char c : name)
        if (c != '_')
          path.push_back(c);
    }
    else
    {
      path = std::string{name};
    }

    std::string out;
    if (!BuildProperty(path, out))
      return std::nullopt;
    return out;
  }

  bool MetaClass::BuildProperty(std::string_view name, std::string &out) const
  {
    PropertyTokenizer prop{name};
    const auto canonical = m_metadata->FindPropertyName(prop.Name());
    if (!canonical)
      return false;
    out.append(*canonical);
    if (!prop.HasNext())
      return true;
    out.push_back('.');
    auto child = ForSegment(PropertyTokenizer{*canonical});
    return child && child->BuildProperty(prop.Children(), out);
  }

  ExpectedTypeExpr MetaClass::GetGenericGetterType(std::string_view name) const
  {
    PropertyTokenizer prop{name};
    if (!prop.HasNext())
      return SegmentType(prop, false);
    auto child = ForSegment(prop);
    if (!child)
      return std::unexpected(child.error());
    return child->GetGenericGetterType(prop.Children());
  }

  ExpectedTypeExpr MetaClass::GetGenericSetterType(std::string_view name) const
  {
    PropertyTokenizer prop{name};
    if (!prop.HasNext())
      return SegmentType(prop, true);
    auto child = ForSegment(prop);
    if (!child)
      return std::unexpected(child.error());
    return child->GetGenericSetterType(prop.Children());
  }

  ExpectedType MetaClass::GetGetterType(std::string_view name) const
  {
    auto type = GetGenericGetterType(name);
    if (!type)
      return std::unexpected(type.error());
    return RawTypeOf(*type);
  }

  ExpectedType MetaClass::GetSetterType(std::string_view name) const
  {
    auto type = GetGenericSetterType(name);
    if (!type)
      return std::unexpected(type.error());
    return RawTypeOf(*type);
  }

  bool MetaClass::HasGetter(std::string_view name) const
  {
    PropertyTokenizer prop{name};
    if (!m_metadata->HasGetter(prop.Name()))
      return false;
    if (!prop.HasNext())
      return true;
    auto child = ForSegment(prop);
    return child && child->HasGetter(prop.Children());
  }

  bool MetaClass::HasSetter(std::string_view name) const
  {
    PropertyTokenizer prop{name};
    if (!prop.HasNext())
      return m_metadata->HasSetter(prop.Name());
    if (!m_metadata->HasSetter(prop.Name()))
      return false;
    auto child = ForSegment(prop);
    return child && child->HasSetter(prop.Children());
  }

} // namespace Trellis
