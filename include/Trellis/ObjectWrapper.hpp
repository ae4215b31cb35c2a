// ObjectWrapper.hpp
// Uniform single-segment access over bean, map and sequence shaped objects
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/TypeExpr.hpp>
#include <Trellis/ObjectRef.hpp>
#include <Trellis/MetaClass.hpp>
#include <Trellis/PropertyTokenizer.hpp>

namespace Trellis
{

  class MetaObject;
  class ObjectFactory;

  // Capability interface a MetaObject delegates the last path segment to.
  // Names passed to the introspection calls may be full paths; wrappers recurse
  // through their owning MetaObject.
  class TRELLIS_API ObjectWrapper
  {
  public:
    virtual ~ObjectWrapper() = default;

    [[nodiscard]] virtual std::expected<Any, Error> Get(const PropertyTokenizer &prop) = 0;
    [[nodiscard]] virtual std::expected<void, Error> Set(const PropertyTokenizer &prop, const Any &value) = 0;
    // In-place slot of the addressed child; a null reference when it is absent
    [[nodiscard]] virtual std::expected<ObjectRef, Error> Locate(const PropertyTokenizer &prop) = 0;

    [[nodiscard]] virtual std::optional<std::string> FindProperty(std::string_view name,
                                                                  bool useCamelCaseMapping) const = 0;
    [[nodiscard]] virtual NGIN::Containers::Vector<std::string> GetGetterNames() const = 0;
    [[nodiscard]] virtual NGIN::Containers::Vector<std::string> GetSetterNames() const = 0;
    [[nodiscard]] virtual ExpectedType GetGetterType(std::string_view name) = 0;
    [[nodiscard]] virtual ExpectedType GetSetterType(std::string_view name) = 0;
    // Resolved generic type of a single segment, used as the context of child navigators
    [[nodiscard]] virtual ExpectedTypeExpr GetGenericGetterType(std::string_view name) const = 0;
    [[nodiscard]] virtual bool HasGetter(std::string_view name) = 0;
    [[nodiscard]] virtual bool HasSetter(std::string_view name) = 0;

    // Create the segment's declared type, store it in place and return where it lives
    [[nodiscard]] virtual std::expected<ObjectRef, Error> InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                                                   ObjectFactory &factory) = 0;

    [[nodiscard]] virtual bool IsCollection() const = 0;
    [[nodiscard]] virtual std::expected<void, Error> Add(const Any &element) = 0;
    [[nodiscard]] virtual std::expected<void, Error> AddAll(std::span<const Any> elements) = 0;
  };

  // Hook for supplying wrappers for specific object types ahead of the built-in selection
  class TRELLIS_API ObjectWrapperFactory
  {
  public:
    virtual ~ObjectWrapperFactory() = default;

    [[nodiscard]] virtual bool HasWrapperFor(const ObjectRef &object) const = 0;
    [[nodiscard]] virtual std::unique_ptr<ObjectWrapper> GetWrapperFor(MetaObject &owner, const ObjectRef &object) = 0;
  };

  class TRELLIS_API DefaultObjectWrapperFactory final : public ObjectWrapperFactory
  {
  public:
    [[nodiscard]] bool HasWrapperFor(const ObjectRef &) const override { return false; }
    [[nodiscard]] std::unique_ptr<ObjectWrapper> GetWrapperFor(MetaObject &, const ObjectRef &) override
    {
      return nullptr;
    }
  };

  // Reflected struct or class: members through the metadata cache, types through the resolver
  class TRELLIS_API BeanWrapper final : public ObjectWrapper
  {
  public:
    BeanWrapper(MetaObject &owner, ObjectRef object);

    std::expected<Any, Error> Get(const PropertyTokenizer &prop) override;
    std::expected<void, Error> Set(const PropertyTokenizer &prop, const Any &value) override;
    std::expected<ObjectRef, Error> Locate(const PropertyTokenizer &prop) override;
    std::optional<std::string> FindProperty(std::string_view name, bool useCamelCaseMapping) const override;
    NGIN::Containers::Vector<std::string> GetGetterNames() const override;
    NGIN::Containers::Vector<std::string> GetSetterNames() const override;
    ExpectedType GetGetterType(std::string_view name) override;
    ExpectedType GetSetterType(std::string_view name) override;
    ExpectedTypeExpr GetGenericGetterType(std::string_view name) const override;
    bool HasGetter(std::string_view name) override;
    bool HasSetter(std::string_view name) override;
    std::expected<ObjectRef, Error> InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                             ObjectFactory &factory) override;
    bool IsCollection() const override { return false; }
    std::expected<void, Error> Add(const Any &element) override;
    std::expected<void, Error> AddAll(std::span<const Any> elements) override;

  private:
    [[nodiscard]] std::expected<ObjectRef, Error> LocateMember(std::string_view name) const;

    MetaObject &m_owner;
    ObjectRef m_object;
    MetaClass m_metaClass;
  };

  // String-keyed map. The segment's indexed name is the key, brackets included.
  class TRELLIS_API MapWrapper final : public ObjectWrapper
  {
  public:
    MapWrapper(MetaObject &owner, ObjectRef object);

    std::expected<Any, Error> Get(const PropertyTokenizer &prop) override;
    std::expected<void, Error> Set(const PropertyTokenizer &prop, const Any &value) override;
    std::expected<ObjectRef, Error> Locate(const PropertyTokenizer &prop) override;
    std::optional<std::string> FindProperty(std::string_view name, bool useCamelCaseMapping) const override;
    NGIN::Containers::Vector<std::string> GetGetterNames() const override;
    NGIN::Containers::Vector<std::string> GetSetterNames() const override;
    ExpectedType GetGetterType(std::string_view name) override;
    ExpectedType GetSetterType(std::string_view name) override;
    ExpectedTypeExpr GetGenericGetterType(std::string_view name) const override;
    bool HasGetter(std::string_view name) override;
    bool HasSetter(std::string_view name) override;
    std::expected<ObjectRef, Error> InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                             ObjectFactory &factory) override;
    bool IsCollection() const override { return false; }
    std::expected<void, Error> Add(const Any &element) override;
    std::expected<void, Error> AddAll(std::span<const Any> elements) override;

  private:
    [[nodiscard]] ExpectedType ValueTypeOf(std::string_view name, bool setter);

    MetaObject &m_owner;
    ObjectRef m_object;
  };

  // Ordered sequence addressed by position ("[2]" or "2")
  class TRELLIS_API CollectionWrapper final : public ObjectWrapper
  {
  public:
    CollectionWrapper(MetaObject &owner, ObjectRef object);

    std::expected<Any, Error> Get(const PropertyTokenizer &prop) override;
    std::expected<void, Error> Set(const PropertyTokenizer &prop, const Any &value) override;
    std::expected<ObjectRef, Error> Locate(const PropertyTokenizer &prop) override;
    std::optional<std::string> FindProperty(std::string_view name, bool useCamelCaseMapping) const override;
    NGIN::Containers::Vector<std::string> GetGetterNames() const override;
    NGIN::Containers::Vector<std::string> GetSetterNames() const override;
    ExpectedType GetGetterType(std::string_view name) override;
    ExpectedType GetSetterType(std::string_view name) override;
    ExpectedTypeExpr GetGenericGetterType(std::string_view name) const override;
    bool HasGetter(std::string_view name) override;
    bool HasSetter(std::string_view name) override;
    std::expected<ObjectRef, Error> InstantiatePropertyValue(const PropertyTokenizer &prop,
                                                             ObjectFactory &factory) override;
    bool IsCollection() const override { return true; }
    std::expected<void, Error> Add(const Any &element) override;
    std::expected<void, Error> AddAll(std::span<const Any> elements) override;

  private:
    MetaObject &m_owner;
    ObjectRef m_object;
  };

} // namespace Trellis
