#include <Trellis/ObjectWrapper.hpp>
#include <Trellis/MetaObject.hpp>
#include <Trellis/ObjectFactory.hpp>

namespace Trellis
{

  BeanWrapper::BeanWrapper(MetaObject &owner, ObjectRef object)
      : m_owner(owner), m_object(std::move(object)),
        m_metaClass(MetaClass::ForContext(owner.GetContext(), owner.GetMetadataCache()))
  {
  }

  std::expected<ObjectRef, Error> BeanWrapper::LocateMember(std::string_view name) const
  {
    const auto *getter = m_metaClass.Metadata().FindGetter(name);
    if (getter == nullptr)
      return std::unexpected(Error{ErrorCode::NotFound, "no getter for property"});
    if (void *address = getter->Address(m_object.Data()))
      return m_object.Child(address, getter->ValueType());
    // By-value getter: navigate a copy
    return ObjectRef::Detached(getter->Load(m_object.Data()));
  }

  std::expected<ObjectRef, Error> BeanWrapper::Locate(const PropertyTokenizer &prop)
  {
    auto slot = LocateMember(prop.Name());
    if (!slot || !prop.HasIndex())
      return slot;
    const auto container = slot->Deref();
    if (container.IsNull())
      return ObjectRef{};
    return container.Element(prop.Index());
  }

  std::expected<Any, Error> BeanWrapper::Get(const PropertyTokenizer &prop)
  {
    if (!prop.HasIndex())
    {
      const auto *getter = m_metaClass.Metadata().FindGetter(prop.Name());
      if (getter == nullptr)
        return std::unexpected(Error{ErrorCode::NotFound, "no getter for property"});
      return getter->Load(m_object.Data());
    }
    auto slot = Locate(prop);
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Load();
  }

  std::expected<void, Error> BeanWrapper::Set(const PropertyTokenizer &prop, const Any &value)
  {
    if (m_object.IsDetached())
      return std::unexpected(Error{ErrorCode::Unsupported, "property value is not addressable"});
    if (!prop.HasIndex())
    {
      const auto *setter = m_metaClass.Metadata().FindSetter(prop.Name());
      if (setter == nullptr)
        return std::unexpected(Error{ErrorCode::NotFound, "no setter for property"});
      return setter->Store(m_object.Data(), value);
    }
    auto slot = LocateMember(prop.Name());
    if (!slot)
      return std::unexpected(slot.error());
    const auto container = slot->Deref();
    if (container.IsNull())
      return std::unexpected(Error{ErrorCode::NotFound, "indexed property is absent"});
    return container.StoreElement(prop.Index(), value);
  }

  std::optional<std::string> BeanWrapper::FindProperty(std::string_view name, bool useCamelCaseMapping) const
  {
    return m_metaClass.FindProperty(name, useCamelCaseMapping);
  }

  NGIN::Containers::Vector<std::string> BeanWrapper::GetGetterNames() const
  {
    return m_metaClass.GetGetterNames();
  }

  NGIN::Containers::Vector<std::string> BeanWrapper::GetSetterNames() const
  {
    return m_metaClass.GetSetterNames();
  }

  ExpectedType BeanWrapper::GetGetterType(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (prop.HasNext())
    {
      // Prefer the runtime child, which may be more specific than the declaration
      auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
      if (child && !(*child)->IsNull())
        return (*child)->GetGetterType(prop.Children());
    }
    return m_metaClass.GetGetterType(name);
  }

  ExpectedType BeanWrapper::GetSetterType(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (prop.HasNext())
    {
      auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
      if (child && !(*child)->IsNull())
        return (*child)->GetSetterType(prop.Children());
    }
    return m_metaClass.GetSetterType(name);
  }

  ExpectedTypeExpr BeanWrapper::GetGenericGetterType(std::string_view name) const
  {
    return m_metaClass.GetGenericGetterType(name);
  }

  bool BeanWrapper::HasGetter(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (!prop.HasNext())
      return m_metaClass.HasGetter(name);
    if (!m_metaClass.HasGetter(prop.IndexedName()))
      return false;
    auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
    if (!child)
      return false;
    if ((*child)->IsNull())
      return m_metaClass.HasGetter(name);
    return (*child)->HasGetter(prop.Children());
  }

  bool BeanWrapper::HasSetter(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (!prop.HasNext())
      return m_metaClass.HasSetter(name);
    if (!m_metaClass.HasSetter(prop.IndexedName()))
      return false;
    auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
    if (!child)
      return false;
    if ((*child)->IsNull())
      return m_metaClass.HasSetter(name);
    return (*child)->HasSetter(prop.Children());
  }

  std::expected<ObjectRef, Error> BeanWrapper::InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                                        ObjectFactory &factory)
  {
    auto type = prop.HasIndex() ? m_metaClass.GetGetterType(prop.IndexedName())
                                : m_metaClass.GetSetterType(prop.Name());
    if (!type)
      return std::unexpected(type.error());

    Type target = *type;
    if (target.GetShape() == Shape::Pointer && target.ElementType().IsValid())
      target = target.ElementType();

    auto created = factory.Create(target);
    if (!created)
      return std::unexpected(created.error());
    if (auto stored = Set(prop, *created); !stored)
      return std::unexpected(stored.error());

    auto slot = Locate(prop);
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Deref();
  }

  std::expected<void, Error> BeanWrapper::Add(const Any &)
  {
    return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
  }

  std::expected<void, Error> BeanWrapper::AddAll(std::span<const Any>)
  {
    return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
  }

} // namespace Trellis
