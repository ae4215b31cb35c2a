#include <Trellis/MetadataCache.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <cctype>
#include <mutex>

namespace Trellis
{

  namespace
  {
    NGIN::UInt64 CaseInsensitiveKey(std::string_view s)
    {
      std::string upper{s};
      for (auto &c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      return NGIN::Hashing::FNV1a64(upper.data(), upper.size());
    }

    bool EqualsIgnoreCase(std::string_view a, std::string_view b)
    {
      if (a.size() != b.size())
        return false;
      for (std::size_t i = 0; i < a.size(); ++i)
      {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i])))
          return false;
      }
      return true;
    }
  } // namespace

  // Accessor
  Type Accessor::DeclaringType() const
  {
    return kind == MemberKind::Field ? field.DeclaringType() : property.DeclaringType();
  }

  Type Accessor::ValueType() const
  {
    return kind == MemberKind::Field ? field.ValueType() : property.ValueType();
  }

  void *Accessor::Address(void *obj) const
  {
    for (NGIN::UIntSize i = 0; i < upcasts.Size() && obj != nullptr; ++i)
      obj = upcasts[i].Upcast(obj);
    if (obj == nullptr)
      return nullptr;
    return kind == MemberKind::Field ? field.GetMut(obj) : property.GetMut(obj);
  }

  Any Accessor::Load(const void *obj) const
  {
    for (NGIN::UIntSize i = 0; i < upcasts.Size() && obj != nullptr; ++i)
      obj = upcasts[i].Upcast(obj);
    if (obj == nullptr)
      return Any::MakeVoid();
    return kind == MemberKind::Field ? field.GetAny(obj) : property.GetAny(obj);
  }

  std::expected<void, Error> Accessor::Store(void *obj, const Any &value) const
  {
    for (NGIN::UIntSize i = 0; i < upcasts.Size() && obj != nullptr; ++i)
      obj = upcasts[i].Upcast(obj);
    if (obj == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    return kind == MemberKind::Field ? field.SetAny(obj, value) : property.SetAny(obj, value);
  }

  // ClassMetadata
  ClassMetadata::ClassMetadata(Type type) : m_type(type)
  {
    if (!m_type.IsValid())
      return;
    m_hasDefaultConstructor = m_type.HasDefaultConstructor();
    Collect(m_type, {});
  }

  void ClassMetadata::Collect(const Type &type, const NGIN::Containers::Vector<Base> &upcasts)
  {
    // Own properties, then own fields, then bases in declaration order. The first
    // accessor registered under a name wins.
    for (NGIN::UIntSize i = 0; i < type.PropertyCount(); ++i)
    {
      const auto p = type.PropertyAt(i);
      Accessor a{};
      a.name = std::string{p.Name()};
      a.kind = MemberKind::Property;
      a.property = p;
      a.upcasts = upcasts;
      if (p.CanRead())
      {
        a.declaredType = p.GetterDeclaredType();
        AddAccessor(a, false);
      }
      if (p.CanWrite())
      {
        a.declaredType = p.SetterDeclaredType();
        AddAccessor(std::move(a), true);
      }
    }
    for (NGIN::UIntSize i = 0; i < type.FieldCount(); ++i)
    {
      const auto f = type.FieldAt(i);
      Accessor a{};
      a.name = std::string{f.Name()};
      a.kind = MemberKind::Field;
      a.field = f;
      a.declaredType = f.DeclaredType();
      a.upcasts = upcasts;
      AddAccessor(a, false);
      AddAccessor(std::move(a), true);
    }
    for (NGIN::UIntSize i = 0; i < type.BaseCount(); ++i)
    {
      const auto base = type.BaseAt(i);
      auto chain = upcasts;
      chain.PushBack(base);
      Collect(base.BaseType(), chain);
    }
  }

  void ClassMetadata::AddAccessor(Accessor accessor, bool setter)
  {
    // Member names are interned at registration, so lookup never grows the interner here
    NameId nid{};
    if (!detail::FindNameId(accessor.name, nid))
      return;
    auto &index = setter ? m_setterIndex : m_getterIndex;
    if (index.GetPtr(nid) != nullptr)
      return;
    auto &table = setter ? m_setters : m_getters;
    auto &names = setter ? m_setterNames : m_getterNames;
    const auto key = CaseInsensitiveKey(accessor.name);
    if (m_caseInsensitive.GetPtr(key) == nullptr)
    {
      m_caseInsensitive.Insert(key, static_cast<NGIN::UInt32>(m_canonicalNames.Size()));
      m_canonicalNames.PushBack(accessor.name);
    }
    names.PushBack(accessor.name);
    index.Insert(nid, static_cast<NGIN::UInt32>(table.Size()));
    table.PushBack(std::move(accessor));
  }

  const Accessor *ClassMetadata::FindGetter(std::string_view name) const
  {
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return nullptr;
    const auto *idx = m_getterIndex.GetPtr(nid);
    return idx == nullptr ? nullptr : &m_getters[*idx];
  }

  const Accessor *ClassMetadata::FindSetter(std::string_view name) const
  {
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return nullptr;
    const auto *idx = m_setterIndex.GetPtr(nid);
    return idx == nullptr ? nullptr : &m_setters[*idx];
  }

  std::optional<std::string_view> ClassMetadata::FindPropertyName(std::string_view name) const
  {
    const auto *idx = m_caseInsensitive.GetPtr(CaseInsensitiveKey(name));
    if (idx == nullptr || !EqualsIgnoreCase(m_canonicalNames[*idx], name))
      return std::nullopt;
    return std::string_view{m_canonicalNames[*idx]};
  }

  // MetadataCache
  std::shared_ptr<const ClassMetadata> MetadataCache::FindForType(const Type &type)
  {
    if (!type.IsValid())
      return std::make_shared<const ClassMetadata>(type);
    if (!IsCacheEnabled())
      return std::make_shared<const ClassMetadata>(type);

    {
      std::shared_lock lock{m_mutex};
      if (auto *entry = m_entries.GetPtr(type.Index()))
        return *entry;
    }

    auto built = std::make_shared<const ClassMetadata>(type);
    std::unique_lock lock{m_mutex};
    if (auto *entry = m_entries.GetPtr(type.Index()))
      return *entry;
    m_entries.Insert(type.Index(), built);
    return built;
  }

  MetadataCache &DefaultMetadataCache()
  {
    static MetadataCache cache;
    return cache;
  }

} // namespace Trellis
