#include <Trellis/MetaObject.hpp>
#include <Trellis/PropertyTokenizer.hpp>

namespace Trellis
{

  namespace
  {
    // Keep a caller-supplied context only when it describes the object itself
    TypeExpr ContextFor(const ObjectRef &object, TypeExpr context)
    {
      const auto type = object.ValueType();
      if (!type.IsValid())
        return TypeExpr{};
      if ((context.IsClass() || context.IsParameterized()) && context.RawType() == type)
        return context;
      return TypeExpr::Class(type);
    }
  } // namespace

  MetaObject::MetaObject(ConstructKey, ObjectRef object, ObjectFactory &objectFactory,
                         ObjectWrapperFactory &wrapperFactory, MetadataCache &cache, TypeExpr context)
      : m_object(std::move(object)), m_context(std::move(context)), m_objectFactory(&objectFactory),
        m_wrapperFactory(&wrapperFactory), m_cache(&cache)
  {
    if (m_object.IsNull())
      return;
    if (m_wrapperFactory->HasWrapperFor(m_object))
      m_wrapper = m_wrapperFactory->GetWrapperFor(*this, m_object);
    if (m_wrapper)
      return;
    switch (m_object.GetShape())
    {
      case Shape::Map: m_wrapper = std::make_unique<MapWrapper>(*this, m_object); break;
      case Shape::Sequence: m_wrapper = std::make_unique<CollectionWrapper>(*this, m_object); break;
      default: m_wrapper = std::make_unique<BeanWrapper>(*this, m_object); break;
    }
  }

  MetaObject::~MetaObject() = default;

  std::unique_ptr<MetaObject> MetaObject::ForObject(ObjectRef object, ObjectFactory &objectFactory,
                                                    ObjectWrapperFactory &wrapperFactory, MetadataCache &cache,
                                                    TypeExpr context)
  {
    auto target = object.Deref();
    auto resolvedContext = ContextFor(target, std::move(context));
    return std::make_unique<MetaObject>(ConstructKey{}, std::move(target), objectFactory, wrapperFactory, cache,
                                        std::move(resolvedContext));
  }

  std::unique_ptr<MetaObject> MetaObject::Wrap(ObjectRef object, TypeExpr context) const
  {
    return ForObject(std::move(object), *m_objectFactory, *m_wrapperFactory, *m_cache, std::move(context));
  }

  std::optional<std::string> MetaObject::FindProperty(std::string_view name, bool useCamelCaseMapping) const
  {
    if (IsNull())
      return std::nullopt;
    return m_wrapper->FindProperty(name, useCamelCaseMapping);
  }

  NGIN::Containers::Vector<std::string> MetaObject::GetGetterNames() const
  {
    if (IsNull())
      return {};
    return m_wrapper->GetGetterNames();
  }

  NGIN::Containers::Vector<std::string> MetaObject::GetSetterNames() const
  {
    if (IsNull())
      return {};
    return m_wrapper->GetSetterNames();
  }

  ExpectedType MetaObject::GetGetterType(std::string_view path)
  {
    if (IsNull())
      return std::unexpected(Error{ErrorCode::NotFound, "object is absent"});
    return m_wrapper->GetGetterType(path);
  }

  ExpectedType MetaObject::GetSetterType(std::string_view path)
  {
    if (IsNull())
      return std::unexpected(Error{ErrorCode::NotFound, "object is absent"});
    return m_wrapper->GetSetterType(path);
  }

  bool MetaObject::HasGetter(std::string_view path)
  {
    return !IsNull() && m_wrapper->HasGetter(path);
  }

  bool MetaObject::HasSetter(std::string_view path)
  {
    return !IsNull() && m_wrapper->HasSetter(path);
  }

  std::expected<Any, Error> MetaObject::GetValue(std::string_view path)
  {
    if (IsNull())
      return Any::MakeVoid();
    PropertyTokenizer prop{path};
    if (!prop.HasNext())
      return m_wrapper->Get(prop);

    auto child = MetaObjectForProperty(prop.IndexedName());
    if (!child)
      return std::unexpected(child.error());
    if ((*child)->IsNull())
      return Any::MakeVoid();
    return (*child)->GetValue(prop.Children());
  }

  std::expected<void, Error> MetaObject::SetValue(std::string_view path, const Any &value)
  {
    if (IsNull())
      return std::unexpected(Error{ErrorCode::Unsupported, "cannot set a property on an absent object"});
    PropertyTokenizer prop{path};
    if (!prop.HasNext())
      return m_wrapper->Set(prop, value);

    auto child = MetaObjectForProperty(prop.IndexedName());
    if (!child)
      return std::unexpected(child.error());
    if ((*child)->IsNull())
    {
      // Nothing to clear below an absent intermediate
      if (!value.HasValue())
        return {};
      auto created = m_wrapper->InstantiatePropertyValue(prop, *m_objectFactory);
      if (!created)
        return std::unexpected(created.error());
      auto context = m_wrapper->GetGenericGetterType(prop.IndexedName());
      *child = Wrap(std::move(*created), context ? std::move(*context) : TypeExpr{});
      if ((*child)->IsNull())
        return std::unexpected(Error{ErrorCode::Unsupported, "instantiated value is not addressable"});
    }
    return (*child)->SetValue(prop.Children(), value);
  }

  std::expected<std::unique_ptr<MetaObject>, Error> MetaObject::MetaObjectForProperty(std::string_view path)
  {
    if (IsNull())
      return Wrap(ObjectRef{}, TypeExpr{});
    PropertyTokenizer prop{path};
    if (prop.HasNext())
    {
      auto child = MetaObjectForProperty(prop.IndexedName());
      if (!child)
        return child;
      return (*child)->MetaObjectForProperty(prop.Children());
    }

    auto slot = m_wrapper->Locate(prop);
    if (!slot)
      return std::unexpected(slot.error());
    auto context = m_wrapper->GetGenericGetterType(prop.IndexedName());
    return Wrap(std::move(*slot), context ? std::move(*context) : TypeExpr{});
  }

  std::expected<ObjectRef, Error> MetaObject::LocateValue(std::string_view path)
  {
    if (IsNull())
      return ObjectRef{};
    PropertyTokenizer prop{path};
    if (prop.HasNext())
    {
      auto child = MetaObjectForProperty(prop.IndexedName());
      if (!child)
        return std::unexpected(child.error());
      return (*child)->LocateValue(prop.Children());
    }
    auto slot = m_wrapper->Locate(prop);
    if (!slot)
      return slot;
    return slot->Deref();
  }

  bool MetaObject::IsCollection() const
  {
    return !IsNull() && m_wrapper->IsCollection();
  }

  std::expected<void, Error> MetaObject::Add(const Any &element)
  {
    if (IsNull())
      return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
    return m_wrapper->Add(element);
  }

  std::expected<void, Error> MetaObject::AddAll(std::span<const Any> elements)
  {
    if (IsNull())
      return std::unexpected(Error{ErrorCode::Unsupported, "operation requires a collection"});
    return m_wrapper->AddAll(elements);
  }

  namespace SystemMetaObject
  {
    ObjectFactory &DefaultFactory()
    {
      static Trellis::DefaultObjectFactory factory;
      return factory;
    }

    ObjectWrapperFactory &DefaultWrapperFactory()
    {
      static Trellis::DefaultObjectWrapperFactory factory;
      return factory;
    }

    std::unique_ptr<MetaObject> ForObject(ObjectRef object, TypeExpr context)
    {
      return MetaObject::ForObject(std::move(object), DefaultFactory(), DefaultWrapperFactory(),
                                   DefaultMetadataCache(), std::move(context));
    }
  } // namespace SystemMetaObject

} // namespace Trellis
