#include <Trellis/ObjectWrapper.hpp>
#include <Trellis/MetaObject.hpp>
#include <Trellis/ObjectFactory.hpp>

namespace Trellis
{

  MapWrapper::MapWrapper(MetaObject &owner, ObjectRef object) : m_owner(owner), m_object(std::move(object)) {}

  std::expected<Any, Error> MapWrapper::Get(const PropertyTokenizer &prop)
  {
    auto slot = m_object.Element(prop.IndexedName());
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Load();
  }

  std::expected<void, Error> MapWrapper::Set(const PropertyTokenizer &prop, const Any &value)
  {
    return m_object.StoreElement(prop.IndexedName(), value);
  }

  std::expected<ObjectRef, Error> MapWrapper::Locate(const PropertyTokenizer &prop)
  {
    return m_object.Element(prop.IndexedName());
  }

  std::optional<std::string> MapWrapper::FindProperty(std::string_view name, bool) const
  {
    return std::string{name};
  }

  NGIN::Containers::Vector<std::string> MapWrapper::GetGetterNames() const
  {
    return m_object.Keys();
  }

  NGIN::Containers::Vector<std::string> MapWrapper::GetSetterNames() const
  {
    return m_object.Keys();
  }

  ExpectedType MapWrapper::ValueTypeOf(std::string_view name, bool setter)
  {
    const auto top = TopType().RawType();
    PropertyTokenizer prop{name};
    if (prop.HasNext())
    {
      auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
      if (!child)
        return std::unexpected(child.error());
      if ((*child)->IsNull())
        return top;
      return setter ? (*child)->GetSetterType(prop.Children()) : (*child)->GetGetterType(prop.Children());
    }
    if (prop.HasIndex())
      return top;

    auto slot = m_object.Element(prop.Name());
    if (!slot)
      return std::unexpected(slot.error());
    const auto value = slot->Deref();
    if (!value.IsNull() && value.ValueType().IsValid())
      return value.ValueType();
    const auto mapped = m_object.ValueType().ElementType();
    return mapped.IsValid() ? mapped : top;
  }

  ExpectedType MapWrapper::GetGetterType(std::string_view name)
  {
    return ValueTypeOf(name, false);
  }

  ExpectedType MapWrapper::GetSetterType(std::string_view name)
  {
    return ValueTypeOf(name, true);
  }

  ExpectedTypeExpr MapWrapper::GetGenericGetterType(std::string_view) const
  {
    return TopType();
  }

  bool MapWrapper::HasGetter(std::string_view name)
  {
    PropertyTokenizer prop{name};
    auto slot = m_object.Element(prop.IndexedName());
    if (!slot || slot->IsNull())
      return false;
    if (!prop.HasNext())
      return true;
    auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
    if (!child)
      return false;
    if ((*child)->IsNull())
      return true;
    return (*child)->HasGetter(prop.Children());
  }

  bool MapWrapper::HasSetter(std::string_view)
  {
    return true;
  }

  std::expected<ObjectRef, Error> MapWrapper::InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                                       ObjectFactory &factory)
  {
    Type target = m_object.ValueType().ElementType();
    if (!target.IsValid())
      target = TopType().RawType();
    if (target.GetShape() == Shape::Pointer && target.ElementType().IsValid())
      target = target.ElementType();

    auto created = factory.Create(target);
    if (!created)
      return std::unexpected(created.error());
    if (auto stored = m_object.StoreElement(prop.IndexedName(), *created); !stored)
      return std::unexpected(stored.error());

    auto slot = m_object.Element(prop.IndexedName());
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Deref();
  }

  std::expected<void, Error> MapWrapper::Add(const Any &)
  {
    return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
  }

  std::expected<void, Error> MapWrapper::AddAll(std::span<const Any>)
  {
    return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
  }

} // namespace Trellis
