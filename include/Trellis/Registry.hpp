// Registry.hpp
// Process-wide type registry and query API
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <string_view>
#include <expected>
#include <span>
#include <type_traits>
#include <initializer_list>
#include <optional>
#include <utility>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/Convert.hpp>
#include <Trellis/Adapters.hpp>
#include <Trellis/TypeExpr.hpp>

namespace Trellis
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace Trellis: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global registry interner
    TRELLIS_API NameId InternNameId(std::string_view s) noexcept;
    TRELLIS_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    TRELLIS_API std::string_view NameFromId(NameId id) noexcept;

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt32 typeIndex{kInvalidIndex};
      void *(*GetMut)(void *){nullptr};
      const void *(*GetConst)(const void *){nullptr};
      TypeExpr declaredType{};
    };

    struct PropertyRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      NGIN::UInt32 typeIndex{kInvalidIndex};
      Any (*Get)(const void *){nullptr};
      std::expected<void, Error> (*Set)(void *, const Any &){nullptr};
      // Only for getters returning a mutable reference
      void *(*GetMut)(void *){nullptr};
      TypeExpr getterDeclaredType{};
      TypeExpr setterDeclaredType{};
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseTypeIndex{kInvalidIndex};
      NGIN::UInt64 baseTypeId{0};
      void *(*Upcast)(void *){nullptr};
      const void *(*UpcastConst)(const void *){nullptr};
      TypeExpr genericEdge{};
      bool isInterface{false};
    };

    struct CtorRuntimeDesc
    {
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      std::expected<Any, Error> (*Construct)(const Any *, NGIN::UIntSize){nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId;
      Shape shape{Shape::Bean};
      Any (*Load)(const void *){nullptr};
      std::expected<void, Error> (*Store)(void *, const Any &){nullptr};
      SequenceOps sequence{};
      MapOps map{};
      PointerOps pointer{};
      NGIN::Containers::Vector<TypeExpr> typeParameters;
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
      NGIN::Containers::Vector<PropertyRuntimeDesc> properties;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> propertyIndex;
      NGIN::Containers::Vector<BaseRuntimeDesc> bases;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> baseIndex;
      NGIN::Containers::Vector<CtorRuntimeDesc> constructors;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    TRELLIS_API Registry &GetRegistry() noexcept;

    template <class T>
    concept HasTrellisReflectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void TrellisReflect(Tag<T>, TypeBuilder<T>&)
      { TrellisReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(TypeBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(Trellis::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    // Traits for pointer-to-member decomposition
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <auto MemberPtr>
    static void *FieldGetterMut(void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      auto *c = static_cast<C *>(obj);
      return static_cast<void *>(&(c->*MemberPtr));
    }

    template <auto MemberPtr>
    static const void *FieldGetterConst(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      auto *c = static_cast<const C *>(obj);
      return static_cast<const void *>(&(c->*MemberPtr));
    }

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.typeId = tid;
      rec.Load = &LoadValue<U>;
      rec.Store = &StoreValue<U>;

      if constexpr (Adapters::is_map_v<U>)
      {
        rec.shape = Shape::Map;
        rec.map = MakeMapOps<U>();
      }
      else if constexpr (Adapters::is_sequence_v<U>)
      {
        rec.shape = Shape::Sequence;
        rec.sequence = MakeSequenceOps<U>();
      }
      else if constexpr (Adapters::is_pointer_like_v<U>)
      {
        rec.shape = Shape::Pointer;
        rec.pointer = MakePointerOps<U>();
      }

      if constexpr (std::is_default_constructible_v<U> && std::is_copy_constructible_v<U>)
      {
        CtorRuntimeDesc c{};
        c.Construct = [](const Any *, NGIN::UIntSize cnt) -> std::expected<Any, Error>
        {
          if (cnt != 0)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
          return Any{U{}};
        };
        rec.constructors.PushBack(std::move(c));
      }

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);

      // Element types are registered after the record exists so self-referencing graphs terminate
      if constexpr (Adapters::is_map_v<U>)
      {
        const auto mapped = EnsureRegistered<typename U::mapped_type>();
        reg.types[idx].map.mappedTypeIndex = mapped;
      }
      else if constexpr (Adapters::is_sequence_v<U>)
      {
        const auto elem = EnsureRegistered<std::remove_cvref_t<decltype(std::declval<U &>()[0])>>();
        reg.types[idx].sequence.elementTypeIndex = elem;
      }
      else if constexpr (Adapters::is_pointer_like_v<U> && !std::is_same_v<U, Any>)
      {
        const auto pointee = EnsureRegistered<Adapters::PointeeT<U>>();
        reg.types[idx].pointer.pointeeTypeIndex = pointee;
      }

      if constexpr (HasTrellisReflectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        TrellisReflect(Tag<U>{}, b); // ADL; user describes fields/properties/bases
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        Trellis::Describe<U>::Do(b); // Trait fallback; public access only
      }
      return idx;
    }

  } // namespace detail

  // Public wrappers
  class TRELLIS_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.fieldIndex < reg.types[m_h.typeIndex].fields.Size();
    }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    // The C++ type of the member
    [[nodiscard]] Type ValueType() const;
    // The generic type the member was declared with
    [[nodiscard]] TypeExpr DeclaredType() const;
    [[nodiscard]] Type DeclaringType() const;

    [[nodiscard]] void *GetMut(void *obj) const;
    [[nodiscard]] const void *GetConst(const void *obj) const;

    [[nodiscard]] Any GetAny(const void *obj) const;
    [[nodiscard]] std::expected<void, Error> SetAny(void *obj, const Any &value) const;

    template <class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] Any GetAny(const Obj &obj) const
    {
      return GetAny(static_cast<const void *>(&obj));
    }

    template <class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<void, Error> SetAny(Obj &obj, const Any &value) const
    {
      return SetAny(static_cast<void *>(&obj), value);
    }

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> Get(const Obj &obj) const
    {
      using U = std::remove_cvref_t<T>;
      if (!IsValid())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
      if (TypeId() != detail::TypeIdOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      const auto *ptr = static_cast<const U *>(GetConst(&obj));
      return *ptr;
    }

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<void, Error> Set(Obj &obj, T &&value) const
    {
      return SetAny(obj, Any{std::forward<T>(value)});
    }

  private:
    FieldHandle m_h{};
    friend class Type;
  };

  class TRELLIS_API Property
  {
  public:
    constexpr Property() = default;
    explicit constexpr Property(PropertyHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.propertyIndex < reg.types[m_h.typeIndex].properties.Size();
    }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 TypeId() const;
    [[nodiscard]] Type ValueType() const;
    [[nodiscard]] TypeExpr GetterDeclaredType() const;
    [[nodiscard]] TypeExpr SetterDeclaredType() const;
    [[nodiscard]] Type DeclaringType() const;

    [[nodiscard]] bool CanRead() const;
    [[nodiscard]] bool CanWrite() const;
    // Non-null only for properties backed by a mutable reference getter
    [[nodiscard]] void *GetMut(void *obj) const;

    [[nodiscard]] Any GetAny(const void *obj) const;
    [[nodiscard]] std::expected<void, Error> SetAny(void *obj, const Any &value) const;

    template <class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] Any GetAny(const Obj &obj) const
    {
      return GetAny(static_cast<const void *>(&obj));
    }

    template <class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<void, Error> SetAny(Obj &obj, const Any &value) const
    {
      return SetAny(static_cast<void *>(&obj), value);
    }

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<std::remove_cvref_t<T>, Error> Get(const Obj &obj) const
    {
      using U = std::remove_cvref_t<T>;
      if (!IsValid())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
      auto any = GetAny(obj);
      if (any.GetTypeId() != detail::TypeIdOf<U>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      return any.template Cast<U>();
    }

    template <class T, class Obj>
    requires (!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<void, Error> Set(Obj &obj, T &&value) const
    {
      return SetAny(obj, Any{std::forward<T>(value)});
    }

  private:
    PropertyHandle m_h{};
    friend class Type;
  };

  class TRELLIS_API Constructor
  {
  public:
    constexpr Constructor() = default;
    explicit constexpr Constructor(ConstructorHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.ctorIndex < reg.types[m_h.typeIndex].constructors.Size();
    }
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] NGIN::UInt64 ParameterTypeId(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<Any, Error> Construct(const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Construct(std::span<const Any> args) const
    {
      return Construct(args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }

  private:
    ConstructorHandle m_h{};
  };

  class TRELLIS_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().types.Size();
    }
    [[nodiscard]] NGIN::UInt32 Index() const noexcept { return m_h.index; }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] Shape GetShape() const;

    // Sequence element, map value or static pointee type; invalid otherwise
    [[nodiscard]] Type ElementType() const;

    // Copy the object at obj into an Any / assign an Any to the object at obj
    [[nodiscard]] Any Load(const void *obj) const;
    [[nodiscard]] std::expected<void, Error> Store(void *obj, const Any &value) const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] Field FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedField GetField(std::string_view name) const;
    [[nodiscard]] std::optional<Field> FindField(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize PropertyCount() const;
    [[nodiscard]] Property PropertyAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedProperty GetProperty(std::string_view name) const;
    [[nodiscard]] std::optional<Property> FindProperty(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize ConstructorCount() const;
    [[nodiscard]] Constructor ConstructorAt(NGIN::UIntSize i) const;
    [[nodiscard]] bool HasDefaultConstructor() const;
    [[nodiscard]] std::expected<Any, Error> Construct(const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Construct(std::span<const Any> args) const
    {
      return Construct(args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }
    [[nodiscard]] std::expected<Any, Error> DefaultConstruct() const
    {
      const Any *none = nullptr;
      return Construct(none, 0);
    }

    // Generic declaration
    [[nodiscard]] NGIN::UIntSize TypeParameterCount() const;
    [[nodiscard]] TypeExpr TypeParameterAt(NGIN::UIntSize i) const;
    // First non-interface base edge, if any
    [[nodiscard]] std::optional<TypeExpr> GenericSuperclass() const;
    // Every non-interface base edge, in declaration order
    [[nodiscard]] NGIN::UIntSize GenericSuperclassCount() const;
    [[nodiscard]] TypeExpr GenericSuperclassAt(NGIN::UIntSize i) const;
    [[nodiscard]] NGIN::UIntSize GenericInterfaceCount() const;
    [[nodiscard]] TypeExpr GenericInterfaceAt(NGIN::UIntSize i) const;

    // Base-class metadata
    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Base BaseAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedBase GetBase(const Type &base) const;
    [[nodiscard]] std::optional<Base> FindBase(const Type &base) const;
    // Transitive; a type is not derived from itself
    [[nodiscard]] bool IsDerivedFrom(const Type &base) const;
    // Reflexive: true when other is this type or derives from it
    [[nodiscard]] bool IsAssignableFrom(const Type &other) const;

    friend bool operator==(const Type &a, const Type &b) noexcept { return a.m_h.index == b.m_h.index; }

  private:
    TypeHandle m_h{};
  };

  class TRELLIS_API Base
  {
  public:
    constexpr Base() = default;
    explicit constexpr Base(BaseHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.baseIndex < reg.types[m_h.typeIndex].bases.Size();
    }
    [[nodiscard]] Type BaseType() const;
    [[nodiscard]] TypeExpr GenericEdge() const;
    [[nodiscard]] bool IsInterface() const;
    [[nodiscard]] void *Upcast(void *obj) const;
    [[nodiscard]] const void *Upcast(const void *obj) const;

  private:
    BaseHandle m_h{};
  };

  // Queries
  TRELLIS_API ExpectedType GetType(std::string_view name);
  TRELLIS_API std::optional<Type> FindType(std::string_view name);
  // Lookup by FNV type id; used to recover the dynamic type held by an Any
  TRELLIS_API std::optional<Type> FindTypeById(NGIN::UInt64 typeId);

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    return FindTypeById(detail::TypeIdOf<std::remove_cvref_t<T>>());
  }

  // Optional eager registration helper
  template <class T>
  inline bool AutoRegister()
  {
    (void)detail::EnsureRegistered<T>();
    return true;
  }

  // Type-expression shorthands for registered C++ types
  template <class T>
  [[nodiscard]] TypeExpr ClassOf()
  {
    return TypeExpr::Class(GetType<T>());
  }

  template <class T>
  [[nodiscard]] TypeExpr ParameterizedOf(std::initializer_list<TypeExpr> args)
  {
    return TypeExpr::Parameterized(GetType<T>(), args);
  }

} // namespace Trellis
