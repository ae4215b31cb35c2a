// MetaClass.hpp
// Instance-free property-path introspection of a type seen through a generic context
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/TypeExpr.hpp>
#include <Trellis/MetadataCache.hpp>

namespace Trellis
{

  class PropertyTokenizer;

  class TRELLIS_API MetaClass
  {
  public:
    [[nodiscard]] static MetaClass ForType(const Type &type, MetadataCache &cache = DefaultMetadataCache());
    // context is a class or parameterized expression; member types are resolved against it
    [[nodiscard]] static MetaClass ForContext(const TypeExpr &context, MetadataCache &cache = DefaultMetadataCache());

    [[nodiscard]] const TypeExpr &Context() const noexcept { return m_context; }
    [[nodiscard]] Type RawType() const noexcept { return m_metadata->DescribedType(); }
    [[nodiscard]] const ClassMetadata &Metadata() const noexcept { return *m_metadata; }

    // MetaClass of the value a (possibly nested, possibly indexed) getter path yields
    [[nodiscard]] std::expected<MetaClass, Error> MetaClassForProperty(std::string_view name) const;

    // Canonical member path for name, matched case-insensitively. With
    // useCamelCaseMapping, underscores are dropped first ("user_name" -> "userName").
    // Index syntax is not part of the result.
    [[nodiscard]] std::optional<std::string> FindProperty(std::string_view name, bool useCamelCaseMapping = false) const;

    [[nodiscard]] const NGIN::Containers::Vector<std::string> &GetGetterNames() const noexcept
    {
      return m_metadata->GetterNames();
    }
    [[nodiscard]] const NGIN::Containers::Vector<std::string> &GetSetterNames() const noexcept
    {
      return m_metadata->SetterNames();
    }

    [[nodiscard]] ExpectedType GetGetterType(std::string_view name) const;
    [[nodiscard]] ExpectedType GetSetterType(std::string_view name) const;
    // Resolved generic type of a getter path. An index selects the element
    // type of a sequence member or the value type of a map member.
    [[nodiscard]] ExpectedTypeExpr GetGenericGetterType(std::string_view name) const;
    [[nodiscard]] ExpectedTypeExpr GetGenericSetterType(std::string_view name) const;

    [[nodiscard]] bool HasGetter(std::string_view name) const;
    [[nodiscard]] bool HasSetter(std::string_view name) const;
    [[nodiscard]] bool HasDefaultConstructor() const noexcept { return m_metadata->HasDefaultConstructor(); }

  private:
    MetaClass(TypeExpr context, std::shared_ptr<const ClassMetadata> metadata, MetadataCache *cache)
        : m_context(std::move(context)), m_metadata(std::move(metadata)), m_cache(cache)
    {
    }

    [[nodiscard]] ExpectedTypeExpr SegmentType(const PropertyTokenizer &prop, bool setter) const;
    [[nodiscard]] std::expected<MetaClass, Error> ForSegment(const PropertyTokenizer &prop) const;
    [[nodiscard]] bool BuildProperty(std::string_view name, std::string &out) const;

    TypeExpr m_context;
    std::shared_ptr<const ClassMetadata> m_metadata;
    MetadataCache *m_cache{nullptr};
  };

} // namespace Trellis
