// Types.hpp
// Public-facing error codes, storage shapes and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <string_view>
#include <expected>

namespace Trellis
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    OutOfRange = 3,
    Unsupported = 4,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
  };

  // How a registered type stores its children
  enum class Shape : NGIN::UInt8
  {
    Bean = 0,     // named fields and properties
    Map = 1,      // string-keyed associative container
    Sequence = 2, // integer-indexed container
    Pointer = 3,  // nullable indirection (shared_ptr, optional, Any)
  };

  inline constexpr NGIN::UInt32 kInvalidIndex = static_cast<NGIN::UInt32>(-1);

  // Small opaque handles (indices into the registry tables)
  struct TypeHandle
  {
    NGIN::UInt32 index{kInvalidIndex};
    constexpr bool IsValid() const noexcept { return index != kInvalidIndex; }
  };

  struct FieldHandle
  {
    NGIN::UInt32 typeIndex{kInvalidIndex};
    NGIN::UInt32 fieldIndex{kInvalidIndex};
    constexpr bool IsValid() const noexcept { return typeIndex != kInvalidIndex && fieldIndex != kInvalidIndex; }
  };

  struct PropertyHandle
  {
    NGIN::UInt32 typeIndex{kInvalidIndex};
    NGIN::UInt32 propertyIndex{kInvalidIndex};
    constexpr bool IsValid() const noexcept { return typeIndex != kInvalidIndex && propertyIndex != kInvalidIndex; }
  };

  struct ConstructorHandle
  {
    NGIN::UInt32 typeIndex{kInvalidIndex};
    NGIN::UInt32 ctorIndex{kInvalidIndex};
    constexpr bool IsValid() const noexcept { return typeIndex != kInvalidIndex && ctorIndex != kInvalidIndex; }
  };

  struct BaseHandle
  {
    NGIN::UInt32 typeIndex{kInvalidIndex};
    NGIN::UInt32 baseIndex{kInvalidIndex};
    constexpr bool IsValid() const noexcept { return typeIndex != kInvalidIndex && baseIndex != kInvalidIndex; }
  };

  enum class MemberKind : unsigned char
  {
    Field = 0,
    Property = 1,
  };

  // Forward decls of high-level wrappers
  class Type;
  class Field;
  class Property;
  class Constructor;
  class Base;
  class TypeExpr;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedField = std::expected<Field, Error>;
  using ExpectedProperty = std::expected<Property, Error>;
  using ExpectedBase = std::expected<Base, Error>;
  using ExpectedTypeExpr = std::expected<TypeExpr, Error>;

} // namespace Trellis
