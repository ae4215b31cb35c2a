#include <Trellis/ObjectWrapper.hpp>
#include <Trellis/MetaObject.hpp>
#include <Trellis/ObjectFactory.hpp>

namespace Trellis
{

  namespace
  {
    std::string_view PositionOf(const PropertyTokenizer &prop)
    {
      return prop.HasIndex() ? prop.Index() : prop.Name();
    }
  } // namespace

  CollectionWrapper::CollectionWrapper(MetaObject &owner, ObjectRef object)
      : m_owner(owner), m_object(std::move(object))
  {
  }

  std::expected<Any, Error> CollectionWrapper::Get(const PropertyTokenizer &prop)
  {
    auto slot = m_object.Element(PositionOf(prop));
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Load();
  }

  std::expected<void, Error> CollectionWrapper::Set(const PropertyTokenizer &prop, const Any &value)
  {
    return m_object.StoreElement(PositionOf(prop), value);
  }

  std::expected<ObjectRef, Error> CollectionWrapper::Locate(const PropertyTokenizer &prop)
  {
    return m_object.Element(PositionOf(prop));
  }

  std::optional<std::string> CollectionWrapper::FindProperty(std::string_view, bool) const
  {
    return std::nullopt;
  }

  NGIN::Containers::Vector<std::string> CollectionWrapper::GetGetterNames() const
  {
    return {};
  }

  NGIN::Containers::Vector<std::string> CollectionWrapper::GetSetterNames() const
  {
    return {};
  }

  ExpectedType CollectionWrapper::GetGetterType(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (prop.HasNext())
    {
      auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
      if (child && !(*child)->IsNull())
        return (*child)->GetGetterType(prop.Children());
    }
    return TopType().RawType();
  }

  ExpectedType CollectionWrapper::GetSetterType(std::string_view name)
  {
    PropertyTokenizer prop{name};
    if (prop.HasNext())
    {
      auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
      if (child && !(*child)->IsNull())
        return (*child)->GetSetterType(prop.Children());
    }
    return TopType().RawType();
  }

  ExpectedTypeExpr CollectionWrapper::GetGenericGetterType(std::string_view) const
  {
    return TopType();
  }

  bool CollectionWrapper::HasGetter(std::string_view name)
  {
    PropertyTokenizer prop{name};
    auto slot = m_object.Element(PositionOf(prop));
    if (!slot || slot->IsNull())
      return false;
    if (!prop.HasNext())
      return true;
    auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
    return child && ((*child)->IsNull() || (*child)->HasGetter(prop.Children()));
  }

  bool CollectionWrapper::HasSetter(std::string_view name)
  {
    PropertyTokenizer prop{name};
    auto slot = m_object.Element(PositionOf(prop));
    if (!slot || slot->IsNull())
      return false;
    if (!prop.HasNext())
      return true;
    auto child = m_owner.MetaObjectForProperty(prop.IndexedName());
    return child && ((*child)->IsNull() || (*child)->HasSetter(prop.Children()));
  }

  std::expected<ObjectRef, Error> CollectionWrapper::InstantiatePropertyValue(const PropertyTokenizer &, ObjectFactory &)
  {
    return std::unexpected(Error{ErrorCode::Unsupported, "cannot instantiate an element inside a collection"});
  }

  std::expected<void, Error> CollectionWrapper::Add(const Any &element)
  {
    return m_object.Append(element);
  }

  std::expected<void, Error> CollectionWrapper::AddAll(std::span<const Any> elements)
  {
    for (const auto &element : elements)
    {
      if (auto r = m_object.Append(element); !r)
        return r;
    }
    return {};
  }

} // namespace Trellis
