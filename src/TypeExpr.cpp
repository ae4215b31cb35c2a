#include <Trellis/TypeExpr.hpp>
#include <Trellis/Registry.hpp>
#include <Trellis/TypeBuilder.hpp>

#include <string>

namespace Trellis::detail
{

  struct TypeNode
  {
    TypeKind kind{TypeKind::Class};
    // Class: the type. Parameterized: the raw type. Variable: the declaring type.
    TypeHandle type{};
    std::string name{};
    // Parameterized: arguments. Variable: bounds. Wildcard: upper bounds. Array: [element].
    NGIN::Containers::Vector<TypeExpr> args{};
    // Wildcard: lower bounds
    NGIN::Containers::Vector<TypeExpr> lower{};
  };

} // namespace Trellis::detail

namespace Trellis
{

  namespace
  {
    const NGIN::Containers::Vector<TypeExpr> &EmptyList()
    {
      static const NGIN::Containers::Vector<TypeExpr> empty{};
      return empty;
    }

    NGIN::Containers::Vector<TypeExpr> ToVector(std::initializer_list<TypeExpr> items)
    {
      NGIN::Containers::Vector<TypeExpr> out;
      out.Reserve(items.size());
      for (const auto &item : items)
        out.PushBack(item);
      return out;
    }

    bool ListsEqual(const NGIN::Containers::Vector<TypeExpr> &a, const NGIN::Containers::Vector<TypeExpr> &b)
    {
      if (a.Size() != b.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < a.Size(); ++i)
      {
        if (!(a[i] == b[i]))
          return false;
      }
      return true;
    }

    void AppendList(std::string &out, const NGIN::Containers::Vector<TypeExpr> &items, std::string_view sep)
    {
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
      {
        if (i != 0)
          out.append(sep);
        out.append(items[i].ToString());
      }
    }
  } // namespace

  TypeExpr TypeExpr::Class(const Type &type)
  {
    auto node = std::make_shared<detail::TypeNode>();
    node->kind = TypeKind::Class;
    node->type = TypeHandle{type.Index()};
    return TypeExpr{std::move(node)};
  }

  TypeExpr TypeExpr::Variable(const Type &declaringType, std::string_view name, std::initializer_list<TypeExpr> bounds)
  {
    return Variable(declaringType, name, ToVector(bounds));
  }

  TypeExpr TypeExpr::Variable(const Type &declaringType, std::string_view name, NGIN::Containers::Vector<TypeExpr> bounds)
  {
    auto node = std::make_shared<detail::TypeNode>();
    node->kind = TypeKind::Variable;
    node->type = TypeHandle{declaringType.Index()};
    node->name = std::string{name};
    node->args = std::move(bounds);
    return TypeExpr{std::move(node)};
  }

  TypeExpr TypeExpr::Parameterized(const Type &raw, std::initializer_list<TypeExpr> args)
  {
    return Parameterized(raw, ToVector(args));
  }

  TypeExpr TypeExpr::Parameterized(const Type &raw, NGIN::Containers::Vector<TypeExpr> args)
  {
    auto node = std::make_shared<detail::TypeNode>();
    node->kind = TypeKind::Parameterized;
    node->type = TypeHandle{raw.Index()};
    node->args = std::move(args);
    return TypeExpr{std::move(node)};
  }

  TypeExpr TypeExpr::Wildcard(NGIN::Containers::Vector<TypeExpr> lowerBounds,
                              NGIN::Containers::Vector<TypeExpr> upperBounds)
  {
    auto node = std::make_shared<detail::TypeNode>();
    node->kind = TypeKind::Wildcard;
    node->args = std::move(upperBounds);
    node->lower = std::move(lowerBounds);
    return TypeExpr{std::move(node)};
  }

  TypeExpr TypeExpr::Array(TypeExpr element)
  {
    auto node = std::make_shared<detail::TypeNode>();
    node->kind = TypeKind::Array;
    node->args.PushBack(std::move(element));
    return TypeExpr{std::move(node)};
  }

  TypeKind TypeExpr::Kind() const noexcept
  {
    return m_node ? m_node->kind : TypeKind::Class;
  }

  Type TypeExpr::RawType() const
  {
    if (!m_node || (m_node->kind != TypeKind::Class && m_node->kind != TypeKind::Parameterized))
      return Type{};
    return Type{m_node->type};
  }

  const NGIN::Containers::Vector<TypeExpr> &TypeExpr::Arguments() const
  {
    if (!m_node || m_node->kind != TypeKind::Parameterized)
      return EmptyList();
    return m_node->args;
  }

  std::string_view TypeExpr::VariableName() const
  {
    if (!m_node || m_node->kind != TypeKind::Variable)
      return {};
    return m_node->name;
  }

  Type TypeExpr::DeclaringType() const
  {
    if (!m_node || m_node->kind != TypeKind::Variable)
      return Type{};
    return Type{m_node->type};
  }

  const NGIN::Containers::Vector<TypeExpr> &TypeExpr::Bounds() const
  {
    if (!m_node || m_node->kind != TypeKind::Variable)
      return EmptyList();
    return m_node->args;
  }

  const NGIN::Containers::Vector<TypeExpr> &TypeExpr::LowerBounds() const
  {
    if (!m_node || m_node->kind != TypeKind::Wildcard)
      return EmptyList();
    return m_node->lower;
  }

  const NGIN::Containers::Vector<TypeExpr> &TypeExpr::UpperBounds() const
  {
    if (!m_node || m_node->kind != TypeKind::Wildcard)
      return EmptyList();
    return m_node->args;
  }

  TypeExpr TypeExpr::ElementType() const
  {
    if (!m_node || m_node->kind != TypeKind::Array)
      return TypeExpr{};
    return m_node->args[0];
  }

  bool TypeExpr::IsGround() const
  {
    if (!m_node)
      return true;
    switch (m_node->kind)
    {
      case TypeKind::Class: return true;
      case TypeKind::Variable: return false;
      default: break;
    }
    for (NGIN::UIntSize i = 0; i < m_node->args.Size(); ++i)
      if (!m_node->args[i].IsGround())
        return false;
    for (NGIN::UIntSize i = 0; i < m_node->lower.Size(); ++i)
      if (!m_node->lower[i].IsGround())
        return false;
    return true;
  }

  std::string TypeExpr::ToString() const
  {
    if (!m_node)
      return "<empty>";
    std::string out;
    switch (m_node->kind)
    {
      case TypeKind::Class:
        out.append(Type{m_node->type}.QualifiedName());
        break;
      case TypeKind::Variable:
        out.append(m_node->name);
        break;
      case TypeKind::Parameterized:
        out.append(Type{m_node->type}.QualifiedName());
        out.push_back('<');
        AppendList(out, m_node->args, ", ");
        out.push_back('>');
        break;
      case TypeKind::Wildcard:
        out.push_back('?');
        if (m_node->lower.Size() != 0)
        {
          out.append(" super ");
          AppendList(out, m_node->lower, " & ");
        }
        else if (m_node->args.Size() != 0)
        {
          out.append(" extends ");
          AppendList(out, m_node->args, " & ");
        }
        break;
      case TypeKind::Array:
        out.append(m_node->args[0].ToString());
        out.append("[]");
        break;
    }
    return out;
  }

  bool operator==(const TypeExpr &a, const TypeExpr &b)
  {
    if (a.m_node == b.m_node)
      return true;
    if (!a.m_node || !b.m_node)
      return false;
    const auto &x = *a.m_node;
    const auto &y = *b.m_node;
    if (x.kind != y.kind)
      return false;
    switch (x.kind)
    {
      case TypeKind::Class: return x.type.index == y.type.index;
      case TypeKind::Variable: return x.type.index == y.type.index && x.name == y.name;
      case TypeKind::Parameterized: return x.type.index == y.type.index && ListsEqual(x.args, y.args);
      case TypeKind::Wildcard: return ListsEqual(x.lower, y.lower) && ListsEqual(x.args, y.args);
      case TypeKind::Array: return x.args[0] == y.args[0];
    }
    return false;
  }

  TypeExpr TopType()
  {
    static const TypeExpr top = ClassOf<Any>();
    return top;
  }

} // namespace Trellis
