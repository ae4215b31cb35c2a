// Convert.hpp
// Shared Any -> T conversion helpers and type-id utilities
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <type_traits>
#include <expected>
#include <string>
#include <string_view>

#include <Trellis/Types.hpp>

namespace Trellis::detail
{

  // Compute FNV-based type id for a type
  template <class T>
  inline NGIN::UInt64 TypeIdOf()
  {
    auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  // Try to convert Any -> To (exact match, arithmetic conversions, string-like to std::string)
  template <class To>
  inline std::expected<std::remove_cv_t<std::remove_reference_t<To>>, Error>
  ConvertAny(const Any &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    if (!src.HasValue())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "value is empty"});
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<Dest>())
    {
      return src.template Cast<Dest>();
    }
    if constexpr (is_numeric_v<Dest>)
    {
      if (tid == TypeIdOf<bool>())
        return static_cast<Dest>(src.template Cast<bool>());
      if (tid == TypeIdOf<char>())
        return static_cast<Dest>(src.template Cast<char>());
      if (tid == TypeIdOf<short>())
        return static_cast<Dest>(src.template Cast<short>());
      if (tid == TypeIdOf<unsigned short>())
        return static_cast<Dest>(src.template Cast<unsigned short>());
      if (tid == TypeIdOf<int>())
        return static_cast<Dest>(src.template Cast<int>());
      if (tid == TypeIdOf<unsigned int>())
        return static_cast<Dest>(src.template Cast<unsigned int>());
      if (tid == TypeIdOf<long>())
        return static_cast<Dest>(src.template Cast<long>());
      if (tid == TypeIdOf<unsigned long>())
        return static_cast<Dest>(src.template Cast<unsigned long>());
      if (tid == TypeIdOf<long long>())
        return static_cast<Dest>(src.template Cast<long long>());
      if (tid == TypeIdOf<unsigned long long>())
        return static_cast<Dest>(src.template Cast<unsigned long long>());
      if (tid == TypeIdOf<float>())
        return static_cast<Dest>(src.template Cast<float>());
      if (tid == TypeIdOf<double>())
        return static_cast<Dest>(src.template Cast<double>());
    }
    if constexpr (std::is_same_v<Dest, std::string>)
    {
      if (tid == TypeIdOf<const char *>())
        return std::string{src.template Cast<const char *>()};
      if (tid == TypeIdOf<std::string_view>())
        return std::string{src.template Cast<std::string_view>()};
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "argument type not convertible"});
  }

} // namespace Trellis::detail
