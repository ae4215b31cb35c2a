#include <Trellis/ObjectRef.hpp>

#include <charconv>

namespace Trellis
{

  namespace
  {
    const detail::TypeRuntimeDesc *DescOf(const Type &type)
    {
      if (!type.IsValid())
        return nullptr;
      return &detail::GetRegistry().types[type.Index()];
    }
  } // namespace

  namespace detail
  {
    std::expected<NGIN::UIntSize, Error> ParseIndex(std::string_view key)
    {
      if (key.empty())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "index is empty"});
      const bool negative = key.front() == '-';
      const auto digits = negative ? key.substr(1) : key;
      NGIN::UIntSize value = 0;
      const auto *last = digits.data() + digits.size();
      auto [ptr, ec] = std::from_chars(digits.data(), last, value);
      if (digits.empty() || ptr != last || (ec != std::errc{} && ec != std::errc::result_out_of_range))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "index is not an integer"});
      if (negative || ec == std::errc::result_out_of_range)
        return std::unexpected(Error{ErrorCode::OutOfRange, "index is out of range"});
      return value;
    }
  } // namespace detail

  ObjectRef ObjectRef::Detached(Any value)
  {
    if (!value.HasValue())
      return ObjectRef{};
    ObjectRef ref;
    ref.m_holder = std::make_shared<Any>(std::move(value));
    ref.m_ptr = const_cast<void *>(static_cast<const void *>(ref.m_holder->Data()));
    ref.m_type = FindTypeById(ref.m_holder->GetTypeId()).value_or(Type{});
    return ref;
  }

  Shape ObjectRef::GetShape() const
  {
    if (m_ptr == nullptr || !m_type.IsValid())
      return Shape::Bean;
    return m_type.GetShape();
  }

  ObjectRef ObjectRef::Deref() const
  {
    ObjectRef current = *this;
    while (!current.IsNull() && current.GetShape() == Shape::Pointer)
    {
      const auto &ops = DescOf(current.m_type)->pointer;
      void *target = ops.Deref(current.m_ptr);
      if (target == nullptr)
        return ObjectRef{};
      Type next{};
      if (ops.pointeeTypeIndex != kInvalidIndex)
        next = Type{TypeHandle{ops.pointeeTypeIndex}};
      else if (ops.DynamicTypeId)
        next = FindTypeById(ops.DynamicTypeId(current.m_ptr)).value_or(Type{});
      current = current.Child(target, next);
    }
    return current;
  }

  Any ObjectRef::Load() const
  {
    if (m_ptr == nullptr || !m_type.IsValid())
      return Any::MakeVoid();
    return m_type.Load(m_ptr);
  }

  std::expected<void, Error> ObjectRef::Store(const Any &value) const
  {
    if (m_ptr == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null reference"});
    if (m_holder)
      return std::unexpected(Error{ErrorCode::Unsupported, "property value is not addressable"});
    if (!m_type.IsValid())
      return std::unexpected(Error{ErrorCode::Unsupported, "unregistered type"});
    return m_type.Store(m_ptr, value);
  }

  NGIN::UIntSize ObjectRef::Size() const
  {
    switch (GetShape())
    {
      case Shape::Sequence: return DescOf(m_type)->sequence.Size(m_ptr);
      case Shape::Map: return DescOf(m_type)->map.Size(m_ptr);
      default: return 0;
    }
  }

  std::expected<ObjectRef, Error> ObjectRef::Element(std::string_view key) const
  {
    switch (GetShape())
    {
      case Shape::Sequence:
      {
        const auto &ops = DescOf(m_type)->sequence;
        auto index = detail::ParseIndex(key);
        if (!index)
          return std::unexpected(index.error());
        if (*index >= ops.Size(m_ptr))
          return std::unexpected(Error{ErrorCode::OutOfRange, "index out of range"});
        return Child(ops.At(m_ptr, *index), Type{TypeHandle{ops.elementTypeIndex}});
      }
      case Shape::Map:
      {
        const auto &ops = DescOf(m_type)->map;
        void *slot = ops.Find(m_ptr, key);
        if (slot == nullptr)
          return ObjectRef{};
        return Child(slot, Type{TypeHandle{ops.mappedTypeIndex}});
      }
      default:
        return std::unexpected(Error{ErrorCode::InvalidArgument, "value is not a sequence or map"});
    }
  }

  std::expected<void, Error> ObjectRef::StoreElement(std::string_view key, const Any &value) const
  {
    const auto shape = GetShape();
    if (shape != Shape::Sequence && shape != Shape::Map)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "value is not a sequence or map"});
    if (m_holder)
      return std::unexpected(Error{ErrorCode::Unsupported, "property value is not addressable"});
    if (shape == Shape::Map)
      return DescOf(m_type)->map.Put(m_ptr, key, value);

    auto slot = Element(key);
    if (!slot)
      return std::unexpected(slot.error());
    return slot->Store(value);
  }

  std::expected<void, Error> ObjectRef::Append(const Any &value) const
  {
    if (GetShape() != Shape::Sequence)
      return std::unexpected(Error{ErrorCode::Unsupported, "value is not a sequence"});
    if (m_holder)
      return std::unexpected(Error{ErrorCode::Unsupported, "property value is not addressable"});
    return DescOf(m_type)->sequence.Append(m_ptr, value);
  }

  NGIN::Containers::Vector<std::string> ObjectRef::Keys() const
  {
    if (GetShape() != Shape::Map)
      return {};
    return DescOf(m_type)->map.Keys(m_ptr);
  }

  ObjectRef ObjectRef::Child(void *ptr, Type type) const
  {
    ObjectRef child{ptr, type};
    child.m_holder = m_holder;
    return child;
  }

} // namespace Trellis
