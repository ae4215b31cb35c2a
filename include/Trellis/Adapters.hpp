// Adapters.hpp
// Storage-shape detection and type-erased sequence/map/pointer operations
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <type_traits>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <unordered_map>

#include <Trellis/Types.hpp>
#include <Trellis/Convert.hpp>

namespace Trellis::Adapters
{

  // Sequence detection (std::vector, NGIN::Containers::Vector)
  template <class T>
  struct is_sequence : std::false_type
  {
  };

  template <class T, class A>
  struct is_sequence<std::vector<T, A>> : std::true_type
  {
  };

  template <class T, class Alloc>
  struct is_sequence<NGIN::Containers::Vector<T, Alloc>> : std::true_type
  {
  };

  template <class T>
  inline constexpr bool is_sequence_v = is_sequence<T>::value;

  // Map detection; only string-keyed maps are addressable by path segments
  template <class T>
  struct is_map : std::false_type
  {
  };

  template <class V, class C, class A>
  struct is_map<std::map<std::string, V, C, A>> : std::true_type
  {
  };

  template <class V, class H, class E, class A>
  struct is_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type
  {
  };

  template <class T>
  inline constexpr bool is_map_v = is_map<T>::value;

  template <class T>
  struct is_shared_ptr : std::false_type
  {
  };

  template <class T>
  struct is_shared_ptr<std::shared_ptr<T>> : std::true_type
  {
  };

  template <class T>
  inline constexpr bool is_shared_ptr_v = is_shared_ptr<T>::value;

  template <class T>
  struct is_optional : std::false_type
  {
  };

  template <class T>
  struct is_optional<std::optional<T>> : std::true_type
  {
  };

  template <class T>
  inline constexpr bool is_optional_v = is_optional<T>::value;

  // Nullable indirections the navigator looks through
  template <class T>
  inline constexpr bool is_pointer_like_v = is_shared_ptr_v<T> || is_optional_v<T> || std::is_same_v<T, Any>;

  template <class T>
  struct PointeeOf
  {
    using type = void;
  };

  template <class T>
  struct PointeeOf<std::shared_ptr<T>>
  {
    using type = T;
  };

  template <class T>
  struct PointeeOf<std::optional<T>>
  {
    using type = T;
  };

  template <class T>
  using PointeeT = typename PointeeOf<T>::type;

} // namespace Trellis::Adapters

namespace Trellis::detail
{

  struct SequenceOps
  {
    NGIN::UInt32 elementTypeIndex{kInvalidIndex};
    NGIN::UIntSize (*Size)(const void *){nullptr};
    void *(*At)(void *, NGIN::UIntSize){nullptr};
    std::expected<void, Error> (*Append)(void *, const Any &){nullptr};
  };

  struct MapOps
  {
    NGIN::UInt32 mappedTypeIndex{kInvalidIndex};
    void *(*Find)(void *, std::string_view){nullptr};
    std::expected<void, Error> (*Put)(void *, std::string_view, const Any &){nullptr};
    bool (*Erase)(void *, std::string_view){nullptr};
    NGIN::UIntSize (*Size)(const void *){nullptr};
    NGIN::Containers::Vector<std::string> (*Keys)(const void *){nullptr};
  };

  struct PointerOps
  {
    // kInvalidIndex when the pointee is only known at runtime (Any)
    NGIN::UInt32 pointeeTypeIndex{kInvalidIndex};
    void *(*Deref)(void *){nullptr};
    NGIN::UInt64 (*DynamicTypeId)(const void *){nullptr};
  };

  template <class U>
  Any LoadValue(const void *src)
  {
    if constexpr (std::is_same_v<U, Any>)
      return *static_cast<const Any *>(src);
    else if constexpr (std::is_copy_constructible_v<U>)
      return Any{*static_cast<const U *>(src)};
    else
      return Any::MakeVoid();
  }

  // Assign an Any into a U slot. Pointer-like slots accept either the
  // pointer type itself or a value of the pointee; an empty Any clears them.
  template <class U>
  std::expected<void, Error> StoreValue(void *dst, const Any &value)
  {
    auto &slot = *static_cast<U *>(dst);
    if constexpr (std::is_same_v<U, Any>)
    {
      slot = value;
      return {};
    }
    else if constexpr (Adapters::is_shared_ptr_v<U> || Adapters::is_optional_v<U>)
    {
      using P = Adapters::PointeeT<U>;
      if (!value.HasValue())
      {
        slot.reset();
        return {};
      }
      if (value.GetTypeId() == TypeIdOf<U>())
      {
        slot = value.template Cast<U>();
        return {};
      }
      if constexpr (std::is_copy_constructible_v<P>)
      {
        auto converted = ConvertAny<P>(value);
        if (!converted)
          return std::unexpected(converted.error());
        if constexpr (Adapters::is_shared_ptr_v<U>)
          slot = std::make_shared<P>(std::move(*converted));
        else
          slot.emplace(std::move(*converted));
        return {};
      }
      else
      {
        return std::unexpected(Error{ErrorCode::Unsupported, "pointee is not copyable"});
      }
    }
    else if constexpr (std::is_copy_assignable_v<U> && std::is_copy_constructible_v<U>)
    {
      auto converted = ConvertAny<U>(value);
      if (!converted)
        return std::unexpected(converted.error());
      slot = std::move(*converted);
      return {};
    }
    else
    {
      return std::unexpected(Error{ErrorCode::Unsupported, "type is not assignable"});
    }
  }

  template <class Seq>
  SequenceOps MakeSequenceOps()
  {
    using Elem = std::remove_cvref_t<decltype(std::declval<Seq &>()[0])>;
    SequenceOps ops{};
    ops.Size = [](const void *s) -> NGIN::UIntSize
    {
      const auto &seq = *static_cast<const Seq *>(s);
      if constexpr (requires(const Seq &q) { q.size(); })
        return static_cast<NGIN::UIntSize>(seq.size());
      else
        return static_cast<NGIN::UIntSize>(seq.Size());
    };
    ops.At = [](void *s, NGIN::UIntSize i) -> void *
    {
      auto &seq = *static_cast<Seq *>(s);
      return static_cast<void *>(&seq[i]);
    };
    ops.Append = [](void *s, const Any &value) -> std::expected<void, Error>
    {
      if constexpr (std::is_default_constructible_v<Elem>)
      {
        auto &seq = *static_cast<Seq *>(s);
        Elem elem{};
        auto r = StoreValue<Elem>(&elem, value);
        if (!r)
          return r;
        if constexpr (requires(Seq &q, Elem &&e) { q.push_back(std::move(e)); })
          seq.push_back(std::move(elem));
        else
          seq.PushBack(std::move(elem));
        return {};
      }
      else
      {
        return std::unexpected(Error{ErrorCode::Unsupported, "element is not default-constructible"});
      }
    };
    return ops;
  }

  template <class Map>
  MapOps MakeMapOps()
  {
    using Mapped = typename Map::mapped_type;
    MapOps ops{};
    ops.Find = [](void *m, std::string_view key) -> void *
    {
      auto &map = *static_cast<Map *>(m);
      auto it = map.find(std::string{key});
      if (it == map.end())
        return nullptr;
      return static_cast<void *>(&it->second);
    };
    ops.Put = [](void *m, std::string_view key, const Any &value) -> std::expected<void, Error>
    {
      auto &map = *static_cast<Map *>(m);
      if (!value.HasValue())
      {
        map.erase(std::string{key});
        return {};
      }
      if constexpr (std::is_default_constructible_v<Mapped>)
      {
        auto [it, inserted] = map.try_emplace(std::string{key});
        auto r = StoreValue<Mapped>(&it->second, value);
        if (!r && inserted)
          map.erase(it);
        return r;
      }
      else
      {
        return std::unexpected(Error{ErrorCode::Unsupported, "mapped type is not default-constructible"});
      }
    };
    ops.Erase = [](void *m, std::string_view key) -> bool
    {
      auto &map = *static_cast<Map *>(m);
      return map.erase(std::string{key}) != 0;
    };
    ops.Size = [](const void *m) -> NGIN::UIntSize
    {
      return static_cast<NGIN::UIntSize>(static_cast<const Map *>(m)->size());
    };
    ops.Keys = [](const void *m) -> NGIN::Containers::Vector<std::string>
    {
      NGIN::Containers::Vector<std::string> keys;
      for (const auto &entry : *static_cast<const Map *>(m))
        keys.PushBack(entry.first);
      return keys;
    };
    return ops;
  }

  template <class Ptr>
  PointerOps MakePointerOps()
  {
    PointerOps ops{};
    if constexpr (std::is_same_v<Ptr, Any>)
    {
      ops.Deref = [](void *p) -> void *
      {
        auto &any = *static_cast<Any *>(p);
        if (!any.HasValue())
          return nullptr;
        return const_cast<void *>(static_cast<const void *>(any.Data()));
      };
      ops.DynamicTypeId = [](const void *p) -> NGIN::UInt64
      {
        return static_cast<const Any *>(p)->GetTypeId();
      };
    }
    else if constexpr (Adapters::is_shared_ptr_v<Ptr>)
    {
      ops.Deref = [](void *p) -> void *
      {
        return static_cast<void *>(static_cast<Ptr *>(p)->get());
      };
    }
    else
    {
      ops.Deref = [](void *p) -> void *
      {
        auto &opt = *static_cast<Ptr *>(p);
        if (!opt.has_value())
          return nullptr;
        return static_cast<void *>(&*opt);
      };
    }
    return ops;
  }

} // namespace Trellis::detail
