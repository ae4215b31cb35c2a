// MetadataCache.hpp
// Per-type accessor tables with inherited members flattened in, cached for the process lifetime
#pragma once

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <atomic>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/Registry.hpp>

namespace Trellis
{

  // Reads or writes one named member of an object of the described type,
  // upcasting through the base chain to the type that declared it.
  struct TRELLIS_API Accessor
  {
    std::string name;
    MemberKind kind{MemberKind::Field};
    Field field{};
    Property property{};
    // Getter or setter declared type, depending on the table holding this accessor
    TypeExpr declaredType{};
    // Base edges from the described type down to the declaring type
    NGIN::Containers::Vector<Base> upcasts{};

    [[nodiscard]] Type DeclaringType() const;
    [[nodiscard]] Type ValueType() const;

    // Address of the member inside obj; nullptr for by-value properties
    [[nodiscard]] void *Address(void *obj) const;
    [[nodiscard]] Any Load(const void *obj) const;
    [[nodiscard]] std::expected<void, Error> Store(void *obj, const Any &value) const;
  };

  class TRELLIS_API ClassMetadata
  {
  public:
    explicit ClassMetadata(Type type);

    [[nodiscard]] Type DescribedType() const noexcept { return m_type; }
    [[nodiscard]] bool HasDefaultConstructor() const noexcept { return m_hasDefaultConstructor; }

    [[nodiscard]] const NGIN::Containers::Vector<std::string> &GetterNames() const noexcept { return m_getterNames; }
    [[nodiscard]] const NGIN::Containers::Vector<std::string> &SetterNames() const noexcept { return m_setterNames; }

    [[nodiscard]] bool HasGetter(std::string_view name) const { return FindGetter(name) != nullptr; }
    [[nodiscard]] bool HasSetter(std::string_view name) const { return FindSetter(name) != nullptr; }
    [[nodiscard]] const Accessor *FindGetter(std::string_view name) const;
    [[nodiscard]] const Accessor *FindSetter(std::string_view name) const;

    // Canonical spelling of a member name, matched ignoring ASCII case
    [[nodiscard]] std::optional<std::string_view> FindPropertyName(std::string_view name) const;

  private:
    void Collect(const Type &type, const NGIN::Containers::Vector<Base> &upcasts);
    void AddAccessor(Accessor accessor, bool setter);

    Type m_type{};
    bool m_hasDefaultConstructor{false};
    NGIN::Containers::Vector<Accessor> m_getters;
    NGIN::Containers::Vector<Accessor> m_setters;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_getterIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_setterIndex;
    // FNV-1a of the upper-cased name -> index into m_canonicalNames
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_caseInsensitive;
    NGIN::Containers::Vector<std::string> m_canonicalNames;
    NGIN::Containers::Vector<std::string> m_getterNames;
    NGIN::Containers::Vector<std::string> m_setterNames;
  };

  // Lazily built ClassMetadata keyed by type. Safe for concurrent lookups:
  // entries are computed outside the lock and the first insert wins.
  class TRELLIS_API MetadataCache
  {
  public:
    MetadataCache() = default;
    MetadataCache(const MetadataCache &) = delete;
    MetadataCache &operator=(const MetadataCache &) = delete;

    [[nodiscard]] std::shared_ptr<const ClassMetadata> FindForType(const Type &type);

    // When disabled every lookup builds a fresh entry
    void SetCacheEnabled(bool enabled) noexcept { m_enabled.store(enabled, std::memory_order_relaxed); }
    [[nodiscard]] bool IsCacheEnabled() const noexcept { return m_enabled.load(std::memory_order_relaxed); }

  private:
    std::shared_mutex m_mutex;
    NGIN::Containers::FlatHashMap<NGIN::UInt32, std::shared_ptr<const ClassMetadata>> m_entries;
    std::atomic<bool> m_enabled{true};
  };

  TRELLIS_API MetadataCache &DefaultMetadataCache();

} // namespace Trellis
