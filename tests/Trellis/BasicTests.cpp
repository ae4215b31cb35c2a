/// @file BasicTests.cpp
/// @brief Smoke tests for the Trellis umbrella header.

#include <catch2/catch_test_macros.hpp>
#include <Trellis/Trellis.hpp>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[trellis][Basics]") {
  CHECK(Trellis::LibraryName() == std::string_view{"Trellis"});
}

TEST_CASE("TopTypeIsTheAnyClass", "[trellis][Basics]") {
  using namespace Trellis;
  CHECK(TopType().IsClass());
  CHECK(TopType().RawType() == GetType<Any>());
  CHECK(GetType<Any>().GetShape() == Shape::Pointer);
}

namespace BasicsDemo {
  struct NeverDescribed {
    int x{0};
  };
} // namespace BasicsDemo

TEST_CASE("TryGetTypeOnlyFindsRegisteredTypes", "[trellis][Basics]") {
  using namespace Trellis;
  CHECK_FALSE(TryGetType<BasicsDemo::NeverDescribed>().has_value());
  auto t = GetType<BasicsDemo::NeverDescribed>();
  auto found = TryGetType<const BasicsDemo::NeverDescribed &>();
  REQUIRE(found.has_value());
  CHECK(*found == t);
}
