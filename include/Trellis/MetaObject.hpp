// MetaObject.hpp
// Property-path navigation over object graphs of beans, maps and sequences
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/TypeExpr.hpp>
#include <Trellis/ObjectRef.hpp>
#include <Trellis/ObjectWrapper.hpp>
#include <Trellis/ObjectFactory.hpp>
#include <Trellis/MetadataCache.hpp>

namespace Trellis
{

  // Navigator over one object. Paths are resolved one segment at a time: the
  // first segment is handed to the wrapper chosen for the object's shape and the
  // remainder to a fresh MetaObject over the child value.
  //
  // A MetaObject over an absent value (IsNull) ends navigation quietly: reads
  // through it yield an empty Any, and writes of an empty value through it do
  // not instantiate anything.
  class TRELLIS_API MetaObject
  {
    // Only ForObject can name this, so construction goes through it
    struct ConstructKey
    {
      explicit ConstructKey() = default;
    };

  public:
    MetaObject(ConstructKey, ObjectRef object, ObjectFactory &objectFactory, ObjectWrapperFactory &wrapperFactory,
               MetadataCache &cache, TypeExpr context);
    MetaObject(const MetaObject &) = delete;
    MetaObject &operator=(const MetaObject &) = delete;
    ~MetaObject();

    // Pointer-like objects are followed to what they hold. context, when it is a
    // class or parameterized expression over the object's type, is used to
    // resolve generic members.
    [[nodiscard]] static std::unique_ptr<MetaObject> ForObject(ObjectRef object, ObjectFactory &objectFactory,
                                                               ObjectWrapperFactory &wrapperFactory,
                                                               MetadataCache &cache, TypeExpr context = {});

    [[nodiscard]] bool IsNull() const noexcept { return m_wrapper == nullptr; }
    [[nodiscard]] const ObjectRef &GetOriginalObject() const noexcept { return m_object; }
    [[nodiscard]] const TypeExpr &GetContext() const noexcept { return m_context; }
    [[nodiscard]] ObjectWrapper *GetObjectWrapper() const noexcept { return m_wrapper.get(); }
    [[nodiscard]] ObjectFactory &GetObjectFactory() const noexcept { return *m_objectFactory; }
    [[nodiscard]] ObjectWrapperFactory &GetObjectWrapperFactory() const noexcept { return *m_wrapperFactory; }
    [[nodiscard]] MetadataCache &GetMetadataCache() const noexcept { return *m_cache; }

    [[nodiscard]] std::optional<std::string> FindProperty(std::string_view name, bool useCamelCaseMapping = false) const;
    [[nodiscard]] NGIN::Containers::Vector<std::string> GetGetterNames() const;
    [[nodiscard]] NGIN::Containers::Vector<std::string> GetSetterNames() const;
    [[nodiscard]] ExpectedType GetGetterType(std::string_view path);
    [[nodiscard]] ExpectedType GetSetterType(std::string_view path);
    [[nodiscard]] bool HasGetter(std::string_view path);
    [[nodiscard]] bool HasSetter(std::string_view path);

    [[nodiscard]] std::expected<Any, Error> GetValue(std::string_view path);
    [[nodiscard]] std::expected<void, Error> SetValue(std::string_view path, const Any &value);

    template <class T>
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> GetValueAs(std::string_view path)
    {
      using U = std::remove_cvref_t<T>;
      auto value = GetValue(path);
      if (!value)
        return std::unexpected(value.error());
      if (!value->HasValue())
        return std::unexpected(Error{ErrorCode::NotFound, "value is absent"});
      return detail::ConvertAny<U>(*value);
    }

    // Navigator over the value at path; a null navigator when it is absent
    [[nodiscard]] std::expected<std::unique_ptr<MetaObject>, Error> MetaObjectForProperty(std::string_view path);
    // In-place location of the value at path, pointer-like slots followed
    [[nodiscard]] std::expected<ObjectRef, Error> LocateValue(std::string_view path);

    [[nodiscard]] bool IsCollection() const;
    [[nodiscard]] std::expected<void, Error> Add(const Any &element);
    [[nodiscard]] std::expected<void, Error> AddAll(std::span<const Any> elements);

  private:
    [[nodiscard]] std::unique_ptr<MetaObject> Wrap(ObjectRef object, TypeExpr context) const;

    ObjectRef m_object;
    TypeExpr m_context;
    ObjectFactory *m_objectFactory;
    ObjectWrapperFactory *m_wrapperFactory;
    MetadataCache *m_cache;
    std::unique_ptr<ObjectWrapper> m_wrapper;
  };

  // Process-wide default collaborators
  namespace SystemMetaObject
  {
    TRELLIS_API ObjectFactory &DefaultFactory();
    TRELLIS_API ObjectWrapperFactory &DefaultWrapperFactory();

    [[nodiscard]] TRELLIS_API std::unique_ptr<MetaObject> ForObject(ObjectRef object, TypeExpr context = {});

    template <class T>
    requires (!std::is_same_v<std::remove_cvref_t<T>, ObjectRef>)
    [[nodiscard]] std::unique_ptr<MetaObject> ForObject(T &object, TypeExpr context = {})
    {
      return ForObject(ObjectRef::Of(object), std::move(context));
    }
  } // namespace SystemMetaObject

} // namespace Trellis
