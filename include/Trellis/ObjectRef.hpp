// ObjectRef.hpp
// Type-erased reference to a live object or container slot
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/Registry.hpp>
#include <Trellis/TypeBuilder.hpp>

namespace Trellis
{

  // Pointer plus registered type. A reference produced from a by-value getter
  // owns a copy of the value: it can be read and navigated but not written.
  class TRELLIS_API ObjectRef
  {
  public:
    ObjectRef() = default;
    ObjectRef(void *ptr, Type type) : m_ptr(ptr), m_type(type) {}

    template <class T>
    requires (!std::is_same_v<std::remove_cvref_t<T>, ObjectRef>)
    [[nodiscard]] static ObjectRef Of(T &object)
    {
      static_assert(!std::is_const_v<T>, "ObjectRef needs a mutable object");
      return ObjectRef{static_cast<void *>(&object), GetType<T>()};
    }

    // Reference owning a copy of value
    [[nodiscard]] static ObjectRef Detached(Any value);

    [[nodiscard]] bool IsNull() const noexcept { return m_ptr == nullptr; }
    [[nodiscard]] bool IsDetached() const noexcept { return m_holder != nullptr; }
    [[nodiscard]] void *Data() const noexcept { return m_ptr; }
    [[nodiscard]] Type ValueType() const noexcept { return m_type; }
    // Bean for unregistered or null references
    [[nodiscard]] Shape GetShape() const;

    // Follow pointer-like slots (shared_ptr, optional, Any) to the object they hold.
    // Returns a null reference when the chain ends in an empty slot.
    [[nodiscard]] ObjectRef Deref() const;

    [[nodiscard]] Any Load() const;
    [[nodiscard]] std::expected<void, Error> Store(const Any &value) const;

    // Sequence and map access. Sequence keys are decimal positions.
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] std::expected<ObjectRef, Error> Element(std::string_view key) const;
    [[nodiscard]] std::expected<void, Error> StoreElement(std::string_view key, const Any &value) const;
    [[nodiscard]] std::expected<void, Error> Append(const Any &value) const;
    [[nodiscard]] NGIN::Containers::Vector<std::string> Keys() const;

    // Reference to a sub-object; shares ownership of a detached value
    [[nodiscard]] ObjectRef Child(void *ptr, Type type) const;

    template <class T>
    [[nodiscard]] T *As() const
    {
      if (m_ptr == nullptr || !m_type.IsValid() || m_type.GetTypeId() != detail::TypeIdOf<std::remove_cvref_t<T>>())
        return nullptr;
      return static_cast<T *>(m_ptr);
    }

  private:
    void *m_ptr{nullptr};
    Type m_type{};
    std::shared_ptr<Any> m_holder{};
  };

  namespace detail
  {
    // Decimal sequence position; InvalidArgument when key is not a number
    TRELLIS_API std::expected<NGIN::UIntSize, Error> ParseIndex(std::string_view key);
  } // namespace detail

} // namespace Trellis
