// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL friend to describe members and generic declarations
#pragma once

#include <Trellis/Registry.hpp>
#include <Trellis/Convert.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Trellis
{

  namespace detail
  {
    template <class>
    struct GetterTraits;

    template <class C, class R>
    struct GetterTraits<R (C::*)() const>
    {
      using Class = C;
      using Ret = R;
    };

    template <class C, class R>
    struct GetterTraits<R (C::*)()>
    {
      using Class = C;
      using Ret = R;
    };

    template <class>
    struct SetterTraits;

    template <class C, class A>
    struct SetterTraits<void (C::*)(A)>
    {
      using Class = C;
      using Arg = std::remove_cvref_t<A>;
    };

    template <std::size_t I, class Tuple>
    inline NGIN::UInt64 ParamTypeId()
    {
      return TypeIdOf<std::tuple_element_t<I, Tuple>>();
    }

    template <class Tuple, std::size_t... I>
    inline void PushCtorParamIds(NGIN::Containers::Vector<NGIN::UInt64> &v, std::index_sequence<I...>)
    {
      (v.PushBack(ParamTypeId<I, Tuple>()), ...);
    }
  } // namespace detail

  template <class T>
  class TypeBuilder
  {
  public:
    // Constructed by the registry when invoking the reflect hook; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Optional name override. If not set, defaults to Meta::TypeName<T>.
    TypeBuilder &SetName(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Declare the next type parameter of T. Order matters: it is the slot
    // that supertype edges and parameterized contexts fill.
    TypeBuilder &TypeParameter(std::string_view name, std::initializer_list<TypeExpr> bounds = {})
    {
      auto var = TypeExpr::Variable(Self(), name, bounds);
      detail::GetRegistry().types[m_index].typeParameters.PushBack(std::move(var));
      return *this;
    }

    // Reference a declared type parameter of T by name
    [[nodiscard]] TypeExpr Var(std::string_view name) const
    {
      const auto &params = detail::GetRegistry().types[m_index].typeParameters;
      for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
      {
        if (params[i].VariableName() == name)
          return params[i];
      }
      return TypeExpr::Variable(Self(), name);
    }

    // Add a public data member. The declared type defaults to the member's C++ type.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name, TypeExpr declared = {})
    {
      using MemberT = std::remove_cvref_t<detail::MemberTypeT<MemberPtr>>;
      const auto memberType = detail::EnsureRegistered<MemberT>();
      detail::FieldRuntimeDesc f{};
      f.nameId = detail::InternNameId(name);
      f.name = detail::NameFromId(f.nameId);
      f.typeIndex = memberType;
      f.GetMut = &detail::FieldGetterMut<MemberPtr>;
      f.GetConst = &detail::FieldGetterConst<MemberPtr>;
      f.declaredType = declared.IsValid() ? std::move(declared) : TypeExpr::Class(Type{TypeHandle{memberType}});

      auto &tdesc = detail::GetRegistry().types[m_index];
      tdesc.fields.PushBack(std::move(f));
      const auto newIdx = static_cast<NGIN::UInt32>(tdesc.fields.Size() - 1);
      tdesc.fieldIndex.Insert(tdesc.fields[newIdx].nameId, newIdx);
      return *this;
    }

    // Getter/setter pair
    template <auto Getter, auto Setter>
    TypeBuilder &Property(std::string_view name, TypeExpr declared = {})
    {
      using GT = detail::GetterTraits<decltype(Getter)>;
      using ST = detail::SetterTraits<decltype(Setter)>;
      using C = typename GT::Class;
      using V = std::remove_cvref_t<typename GT::Ret>;
      using A = typename ST::Arg;
      static_assert(std::is_base_of_v<C, T> && std::is_base_of_v<typename ST::Class, T>, "Accessors must belong to T");

      detail::PropertyRuntimeDesc p{};
      p.Get = [](const void *obj) -> Any
      {
        auto *c = const_cast<C *>(static_cast<const C *>(obj));
        V value = (c->*Getter)();
        return Any{std::move(value)};
      };
      p.Set = [](void *obj, const Any &value) -> std::expected<void, Error>
      {
        auto *c = static_cast<typename ST::Class *>(obj);
        A arg{};
        auto r = detail::StoreValue<A>(&arg, value);
        if (!r)
          return r;
        (c->*Setter)(std::move(arg));
        return {};
      };
      return AddProperty<V>(name, std::move(p), std::move(declared));
    }

    // Single getter. A mutable reference getter also yields a setter.
    template <auto RefGetter>
    TypeBuilder &Property(std::string_view name, TypeExpr declared = {})
    {
      using GT = detail::GetterTraits<decltype(RefGetter)>;
      using C = typename GT::Class;
      using R = typename GT::Ret;
      using V = std::remove_cvref_t<R>;
      static_assert(std::is_base_of_v<C, T>, "Accessor must belong to T");

      detail::PropertyRuntimeDesc p{};
      p.Get = [](const void *obj) -> Any
      {
        auto *c = const_cast<C *>(static_cast<const C *>(obj));
        return detail::LoadValue<V>(&static_cast<const V &>((c->*RefGetter)()));
      };
      if constexpr (std::is_lvalue_reference_v<R> && !std::is_const_v<std::remove_reference_t<R>>)
      {
        p.GetMut = [](void *obj) -> void *
        {
          auto *c = static_cast<C *>(obj);
          return static_cast<void *>(&(c->*RefGetter)());
        };
        p.Set = [](void *obj, const Any &value) -> std::expected<void, Error>
        {
          auto *c = static_cast<C *>(obj);
          return detail::StoreValue<V>(static_cast<void *>(&(c->*RefGetter)()), value);
        };
      }
      return AddProperty<V>(name, std::move(p), std::move(declared));
    }

    // Add a constructor descriptor for T with parameter types A...
    template <class... A>
    TypeBuilder &Constructor()
    {
      detail::CtorRuntimeDesc c{};
      if constexpr (sizeof...(A) > 0)
      {
        using Tuple = std::tuple<std::remove_cvref_t<A>...>;
        detail::PushCtorParamIds<Tuple>(c.paramTypeIds, std::make_index_sequence<sizeof...(A)>{});
      }
      c.Construct = [](const Any *args, NGIN::UIntSize count) -> std::expected<Any, Error>
      {
        if (count != sizeof...(A))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        return [&]<std::size_t... I>(std::index_sequence<I...>) -> std::expected<Any, Error>
        {
          if (((detail::ConvertAny<std::remove_cvref_t<A>>(args[I]).has_value()) && ...))
          {
            T obj{detail::ConvertAny<std::remove_cvref_t<A>>(args[I]).value()...};
            return Any{std::move(obj)};
          }
          return std::unexpected(Error{ErrorCode::InvalidArgument, "argument conversion failed"});
        }(std::make_index_sequence<sizeof...(A)>{});
      };
      detail::GetRegistry().types[m_index].constructors.PushBack(std::move(c));
      return *this;
    }

    // Superclass edge. Arguments fill B's type parameters in declaration order.
    template <class B>
    TypeBuilder &Base(std::initializer_list<TypeExpr> args = {})
    {
      return AddBase<B>(args, false);
    }

    // Superinterface edge; walked after the superclass, in declaration order.
    template <class B>
    TypeBuilder &Interface(std::initializer_list<TypeExpr> args = {})
    {
      return AddBase<B>(args, true);
    }

  private:
    [[nodiscard]] Type Self() const { return Type{TypeHandle{m_index}}; }

    template <class V>
    TypeBuilder &AddProperty(std::string_view name, detail::PropertyRuntimeDesc p, TypeExpr declared)
    {
      const auto valueType = detail::EnsureRegistered<V>();
      p.nameId = detail::InternNameId(name);
      p.name = detail::NameFromId(p.nameId);
      p.typeIndex = valueType;
      if (!declared.IsValid())
        declared = TypeExpr::Class(Type{TypeHandle{valueType}});
      p.getterDeclaredType = declared;
      if (p.Set)
        p.setterDeclaredType = std::move(declared);

      auto &tdesc = detail::GetRegistry().types[m_index];
      tdesc.properties.PushBack(std::move(p));
      const auto newIdx = static_cast<NGIN::UInt32>(tdesc.properties.Size() - 1);
      tdesc.propertyIndex.Insert(tdesc.properties[newIdx].nameId, newIdx);
      return *this;
    }

    template <class B>
    TypeBuilder &AddBase(std::initializer_list<TypeExpr> args, bool isInterface)
    {
      static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>, "B must be a base of T");
      const auto baseType = detail::EnsureRegistered<B>();
      detail::BaseRuntimeDesc d{};
      d.baseTypeIndex = baseType;
      d.baseTypeId = detail::TypeIdOf<B>();
      d.Upcast = [](void *p) -> void *
      {
        return static_cast<void *>(static_cast<B *>(static_cast<T *>(p)));
      };
      d.UpcastConst = [](const void *p) -> const void *
      {
        return static_cast<const void *>(static_cast<const B *>(static_cast<const T *>(p)));
      };
      const Type bt{TypeHandle{baseType}};
      d.genericEdge = args.size() == 0 ? TypeExpr::Class(bt) : TypeExpr::Parameterized(bt, args);
      d.isInterface = isInterface;

      auto &tdesc = detail::GetRegistry().types[m_index];
      tdesc.bases.PushBack(std::move(d));
      tdesc.baseIndex.Insert(tdesc.bases[tdesc.bases.Size() - 1].baseTypeId,
                             static_cast<NGIN::UInt32>(tdesc.bases.Size() - 1));
      return *this;
    }

    NGIN::UInt32 m_index{0};
  };

} // namespace Trellis
