#include <Trellis/Registry.hpp>
#include <Trellis/TypeBuilder.hpp>

#include <optional>

namespace Trellis::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

} // namespace Trellis::detail

namespace Trellis
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(NGIN::UInt32 index)
    {
      return index != kInvalidIndex && index < GetRegistry().types.Size();
    }

    bool IsFieldAlive(FieldHandle h)
    {
      return IsTypeAlive(h.typeIndex) && h.fieldIndex < GetRegistry().types[h.typeIndex].fields.Size();
    }

    bool IsPropertyAlive(PropertyHandle h)
    {
      return IsTypeAlive(h.typeIndex) && h.propertyIndex < GetRegistry().types[h.typeIndex].properties.Size();
    }

    bool IsCtorAlive(ConstructorHandle h)
    {
      return IsTypeAlive(h.typeIndex) && h.ctorIndex < GetRegistry().types[h.typeIndex].constructors.Size();
    }

    bool IsBaseAlive(BaseHandle h)
    {
      return IsTypeAlive(h.typeIndex) && h.baseIndex < GetRegistry().types[h.typeIndex].bases.Size();
    }

    // Depth-first walk over registered bases
    bool DerivesFrom(NGIN::UInt32 index, NGIN::UInt64 baseTypeId)
    {
      const auto &tdesc = GetRegistry().types[index];
      if (tdesc.baseIndex.GetPtr(baseTypeId) != nullptr)
        return true;
      for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
      {
        if (DerivesFrom(tdesc.bases[i].baseTypeIndex, baseTypeId))
          return true;
      }
      return false;
    }
  } // namespace

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h.index))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].typeId;
  }

  Shape Type::GetShape() const
  {
    if (!IsTypeAlive(m_h.index))
      return Shape::Bean;
    return GetRegistry().types[m_h.index].shape;
  }

  Type Type::ElementType() const
  {
    if (!IsTypeAlive(m_h.index))
      return Type{};
    const auto &tdesc = GetRegistry().types[m_h.index];
    switch (tdesc.shape)
    {
      case Shape::Sequence: return Type{TypeHandle{tdesc.sequence.elementTypeIndex}};
      case Shape::Map: return Type{TypeHandle{tdesc.map.mappedTypeIndex}};
      case Shape::Pointer: return Type{TypeHandle{tdesc.pointer.pointeeTypeIndex}};
      default: break;
    }
    return Type{};
  }

  Any Type::Load(const void *obj) const
  {
    if (!IsTypeAlive(m_h.index) || obj == nullptr)
      return Any::MakeVoid();
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (!tdesc.Load)
      return Any::MakeVoid();
    return tdesc.Load(obj);
  }

  std::expected<void, Error> Type::Store(void *obj, const Any &value) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (obj == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null target"});
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (!tdesc.Store)
      return std::unexpected(Error{ErrorCode::Unsupported, "type is not assignable"});
    return tdesc.Store(obj, value);
  }

  NGIN::UIntSize Type::FieldCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].fields.Size();
  }

  Field Type::FieldAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Field{};
    return Field{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedField Type::GetField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (auto f = FindField(name))
      return *f;
    return std::unexpected(Error{ErrorCode::NotFound, "field not found"});
  }

  std::optional<Field> Type::FindField(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.fieldIndex.GetPtr(nid))
        return Field{FieldHandle{m_h.index, *p}};
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::PropertyCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].properties.Size();
  }

  Property Type::PropertyAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Property{};
    return Property{PropertyHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedProperty Type::GetProperty(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (auto p = FindProperty(name))
      return *p;
    return std::unexpected(Error{ErrorCode::NotFound, "property not found"});
  }

  std::optional<Property> Type::FindProperty(std::string_view name) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.propertyIndex.GetPtr(nid))
        return Property{PropertyHandle{m_h.index, *p}};
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::ConstructorCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].constructors.Size();
  }

  Constructor Type::ConstructorAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Constructor{};
    return Constructor{ConstructorHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  bool Type::HasDefaultConstructor() const
  {
    if (!IsTypeAlive(m_h.index))
      return false;
    const auto &tdesc = GetRegistry().types[m_h.index];
    for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
    {
      if (tdesc.constructors[i].paramTypeIds.Size() == 0 && tdesc.constructors[i].Construct)
        return true;
    }
    return false;
  }

  std::expected<Any, Error> Type::Construct(const Any *args, NGIN::UIntSize count) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (count == 0)
    {
      for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
      {
        const auto &c = tdesc.constructors[i];
        if (c.paramTypeIds.Size() == 0 && c.Construct)
          return c.Construct(nullptr, 0);
      }
      return std::unexpected(Error{ErrorCode::NotFound, "no default constructor"});
    }

    // Prefer an exact parameter match, then the first constructor whose arguments convert
    NGIN::UInt32 fallback = kInvalidIndex;
    for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
    {
      const auto &c = tdesc.constructors[i];
      if (c.paramTypeIds.Size() != count || !c.Construct)
        continue;
      bool exact = true;
      for (NGIN::UIntSize k = 0; k < count; ++k)
      {
        if (args[k].GetTypeId() != c.paramTypeIds[k])
        {
          exact = false;
          break;
        }
      }
      if (exact)
        return c.Construct(args, count);
      if (fallback == kInvalidIndex)
        fallback = static_cast<NGIN::UInt32>(i);
    }
    if (fallback == kInvalidIndex)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "no viable constructor"});
    return tdesc.constructors[fallback].Construct(args, count);
  }

  NGIN::UIntSize Type::TypeParameterCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].typeParameters.Size();
  }

  TypeExpr Type::TypeParameterAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return TypeExpr{};
    const auto &params = GetRegistry().types[m_h.index].typeParameters;
    if (i >= params.Size())
      return TypeExpr{};
    return params[i];
  }

  std::optional<TypeExpr> Type::GenericSuperclass() const
  {
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    const auto &bases = GetRegistry().types[m_h.index].bases;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
    {
      if (!bases[i].isInterface)
        return bases[i].genericEdge;
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::GenericSuperclassCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    const auto &bases = GetRegistry().types[m_h.index].bases;
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
      if (!bases[i].isInterface)
        ++n;
    return n;
  }

  TypeExpr Type::GenericSuperclassAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return TypeExpr{};
    const auto &bases = GetRegistry().types[m_h.index].bases;
    for (NGIN::UIntSize k = 0; k < bases.Size(); ++k)
    {
      if (bases[k].isInterface)
        continue;
      if (i == 0)
        return bases[k].genericEdge;
      --i;
    }
    return TypeExpr{};
  }

  NGIN::UIntSize Type::GenericInterfaceCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    const auto &bases = GetRegistry().types[m_h.index].bases;
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
      if (bases[i].isInterface)
        ++n;
    return n;
  }

  TypeExpr Type::GenericInterfaceAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return TypeExpr{};
    const auto &bases = GetRegistry().types[m_h.index].bases;
    for (NGIN::UIntSize k = 0; k < bases.Size(); ++k)
    {
      if (!bases[k].isInterface)
        continue;
      if (i == 0)
        return bases[k].genericEdge;
      --i;
    }
    return TypeExpr{};
  }

  NGIN::UIntSize Type::BaseCount() const
  {
    if (!IsTypeAlive(m_h.index))
      return 0;
    return GetRegistry().types[m_h.index].bases.Size();
  }

  Base Type::BaseAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h.index))
      return Base{};
    return Base{BaseHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedBase Type::GetBase(const Type &base) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (auto b = FindBase(base))
      return *b;
    return std::unexpected(Error{ErrorCode::NotFound, "base type not found"});
  }

  std::optional<Base> Type::FindBase(const Type &base) const
  {
    if (!IsTypeAlive(m_h.index))
      return std::nullopt;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (auto *p = tdesc.baseIndex.GetPtr(base.GetTypeId()))
      return Base{BaseHandle{m_h.index, *p}};
    return std::nullopt;
  }

  bool Type::IsDerivedFrom(const Type &base) const
  {
    if (!IsTypeAlive(m_h.index) || !base.IsValid())
      return false;
    return DerivesFrom(m_h.index, base.GetTypeId());
  }

  bool Type::IsAssignableFrom(const Type &other) const
  {
    if (!IsValid() || !other.IsValid())
      return false;
    return *this == other || other.IsDerivedFrom(*this);
  }

  // Field
  std::string_view Field::Name() const
  {
    if (!IsFieldAlive(m_h))
      return {};
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].name;
  }

  NGIN::UInt64 Field::TypeId() const
  {
    return ValueType().GetTypeId();
  }

  Type Field::ValueType() const
  {
    if (!IsFieldAlive(m_h))
      return Type{};
    return Type{TypeHandle{GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].typeIndex}};
  }

  TypeExpr Field::DeclaredType() const
  {
    if (!IsFieldAlive(m_h))
      return TypeExpr{};
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].declaredType;
  }

  Type Field::DeclaringType() const
  {
    if (!IsFieldAlive(m_h))
      return Type{};
    return Type{TypeHandle{m_h.typeIndex}};
  }

  void *Field::GetMut(void *obj) const
  {
    if (!IsFieldAlive(m_h))
      return nullptr;
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].GetMut(obj);
  }

  const void *Field::GetConst(const void *obj) const
  {
    if (!IsFieldAlive(m_h))
      return nullptr;
    return GetRegistry().types[m_h.typeIndex].fields[m_h.fieldIndex].GetConst(obj);
  }

  Any Field::GetAny(const void *obj) const
  {
    if (!IsFieldAlive(m_h))
      return Any::MakeVoid();
    return ValueType().Load(GetConst(obj));
  }

  std::expected<void, Error> Field::SetAny(void *obj, const Any &value) const
  {
    if (!IsFieldAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    return ValueType().Store(GetMut(obj), value);
  }

  // Property
  std::string_view Property::Name() const
  {
    if (!IsPropertyAlive(m_h))
      return {};
    return GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].name;
  }

  NGIN::UInt64 Property::TypeId() const
  {
    return ValueType().GetTypeId();
  }

  Type Property::ValueType() const
  {
    if (!IsPropertyAlive(m_h))
      return Type{};
    return Type{TypeHandle{GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].typeIndex}};
  }

  TypeExpr Property::GetterDeclaredType() const
  {
    if (!IsPropertyAlive(m_h))
      return TypeExpr{};
    return GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].getterDeclaredType;
  }

  TypeExpr Property::SetterDeclaredType() const
  {
    if (!IsPropertyAlive(m_h))
      return TypeExpr{};
    return GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].setterDeclaredType;
  }

  Type Property::DeclaringType() const
  {
    if (!IsPropertyAlive(m_h))
      return Type{};
    return Type{TypeHandle{m_h.typeIndex}};
  }

  bool Property::CanRead() const
  {
    return IsPropertyAlive(m_h) && GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].Get != nullptr;
  }

  bool Property::CanWrite() const
  {
    return IsPropertyAlive(m_h) && GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex].Set != nullptr;
  }

  void *Property::GetMut(void *obj) const
  {
    if (!IsPropertyAlive(m_h))
      return nullptr;
    const auto &p = GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex];
    if (!p.GetMut)
      return nullptr;
    return p.GetMut(obj);
  }

  Any Property::GetAny(const void *obj) const
  {
    if (!IsPropertyAlive(m_h))
      return Any::MakeVoid();
    const auto &p = GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex];
    if (p.Get)
      return p.Get(obj);
    return Any::MakeVoid();
  }

  std::expected<void, Error> Property::SetAny(void *obj, const Any &value) const
  {
    if (!IsPropertyAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &p = GetRegistry().types[m_h.typeIndex].properties[m_h.propertyIndex];
    if (!p.Set)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "property is read-only"});
    return p.Set(obj, value);
  }

  // Constructor
  NGIN::UIntSize Constructor::ParameterCount() const
  {
    if (!IsCtorAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex].paramTypeIds.Size();
  }

  NGIN::UInt64 Constructor::ParameterTypeId(NGIN::UIntSize i) const
  {
    if (!IsCtorAlive(m_h))
      return 0;
    const auto &ids = GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex].paramTypeIds;
    return i < ids.Size() ? ids[i] : 0;
  }

  std::expected<Any, Error> Constructor::Construct(const Any *args, NGIN::UIntSize count) const
  {
    if (!IsCtorAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &c = GetRegistry().types[m_h.typeIndex].constructors[m_h.ctorIndex];
    if (!c.Construct)
      return std::unexpected(Error{ErrorCode::NotFound, "constructor not available"});
    return c.Construct(args, count);
  }

  // Base
  Type Base::BaseType() const
  {
    if (!IsBaseAlive(m_h))
      return Type{};
    return Type{TypeHandle{GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex].baseTypeIndex}};
  }

  TypeExpr Base::GenericEdge() const
  {
    if (!IsBaseAlive(m_h))
      return TypeExpr{};
    return GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex].genericEdge;
  }

  bool Base::IsInterface() const
  {
    return IsBaseAlive(m_h) && GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex].isInterface;
  }

  void *Base::Upcast(void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    if (!b.Upcast)
      return nullptr;
    return b.Upcast(obj);
  }

  const void *Base::Upcast(const void *obj) const
  {
    if (!IsBaseAlive(m_h))
      return nullptr;
    const auto &b = GetRegistry().types[m_h.typeIndex].bases[m_h.baseIndex];
    if (!b.UpcastConst)
      return nullptr;
    return b.UpcastConst(obj);
  }

  // Queries
  ExpectedType GetType(std::string_view name)
  {
    if (auto t = FindType(name))
      return *t;
    return std::unexpected(Error{ErrorCode::NotFound, "type not found"});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p}};
    }
    return std::nullopt;
  }

  std::optional<Type> FindTypeById(NGIN::UInt64 typeId)
  {
    auto &reg = GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(typeId))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

} // namespace Trellis
