// TypeExpr.hpp
// Immutable generic type expressions (class, variable, parameterized, wildcard, array)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>

namespace Trellis
{

  enum class TypeKind : NGIN::UInt8
  {
    Class = 0,
    Variable = 1,
    Parameterized = 2,
    Wildcard = 3,
    Array = 4,
  };

  namespace detail
  {
    struct TypeNode;
  }

  // A shared, immutable node tree. Copies are cheap and never alias mutable state.
  // A default-constructed TypeExpr is empty (IsValid() == false).
  class TRELLIS_API TypeExpr
  {
  public:
    TypeExpr() = default;

    [[nodiscard]] static TypeExpr Class(const Type &type);
    [[nodiscard]] static TypeExpr Variable(const Type &declaringType, std::string_view name,
                                           std::initializer_list<TypeExpr> bounds = {});
    [[nodiscard]] static TypeExpr Variable(const Type &declaringType, std::string_view name,
                                           NGIN::Containers::Vector<TypeExpr> bounds);
    [[nodiscard]] static TypeExpr Parameterized(const Type &raw, std::initializer_list<TypeExpr> args);
    [[nodiscard]] static TypeExpr Parameterized(const Type &raw, NGIN::Containers::Vector<TypeExpr> args);
    [[nodiscard]] static TypeExpr Wildcard(NGIN::Containers::Vector<TypeExpr> lowerBounds,
                                           NGIN::Containers::Vector<TypeExpr> upperBounds);
    [[nodiscard]] static TypeExpr Array(TypeExpr element);

    [[nodiscard]] bool IsValid() const noexcept { return m_node != nullptr; }
    [[nodiscard]] TypeKind Kind() const noexcept;

    [[nodiscard]] bool IsClass() const noexcept { return IsValid() && Kind() == TypeKind::Class; }
    [[nodiscard]] bool IsVariable() const noexcept { return IsValid() && Kind() == TypeKind::Variable; }
    [[nodiscard]] bool IsParameterized() const noexcept { return IsValid() && Kind() == TypeKind::Parameterized; }
    [[nodiscard]] bool IsWildcard() const noexcept { return IsValid() && Kind() == TypeKind::Wildcard; }
    [[nodiscard]] bool IsArray() const noexcept { return IsValid() && Kind() == TypeKind::Array; }

    // Class: the type itself. Parameterized: the raw type. Otherwise invalid.
    [[nodiscard]] Type RawType() const;
    // Parameterized only
    [[nodiscard]] const NGIN::Containers::Vector<TypeExpr> &Arguments() const;
    // Variable only
    [[nodiscard]] std::string_view VariableName() const;
    [[nodiscard]] Type DeclaringType() const;
    [[nodiscard]] const NGIN::Containers::Vector<TypeExpr> &Bounds() const;
    // Wildcard only
    [[nodiscard]] const NGIN::Containers::Vector<TypeExpr> &LowerBounds() const;
    [[nodiscard]] const NGIN::Containers::Vector<TypeExpr> &UpperBounds() const;
    // Array only
    [[nodiscard]] TypeExpr ElementType() const;

    // True when no type variable occurs anywhere in the tree
    [[nodiscard]] bool IsGround() const;

    [[nodiscard]] std::string ToString() const;

    friend TRELLIS_API bool operator==(const TypeExpr &a, const TypeExpr &b);

  private:
    explicit TypeExpr(std::shared_ptr<const detail::TypeNode> node) : m_node(std::move(node)) {}

    std::shared_ptr<const detail::TypeNode> m_node{};
  };

  // The universal top type (the class of Trellis::Any)
  [[nodiscard]] TRELLIS_API TypeExpr TopType();

} // namespace Trellis
