// Constructors.cpp - tests for default and parameterized constructors

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

namespace CtorDemo
{
  struct Point
  {
    int x{0};
    int y{0};
    Point() = default;
    Point(int a, int b) : x(a), y(b) {}
    friend void TrellisReflect(Trellis::Tag<Point>,
                               Trellis::TypeBuilder<Point> &b)
    {
      b.SetName("CtorDemo::Point");
      b.Field<&Point::x>("x");
      b.Field<&Point::y>("y");
      b.Constructor<int, int>();
    }
  };

  struct Handle
  {
    explicit Handle(int v) : value(v) {}
    int value;
    friend void TrellisReflect(Trellis::Tag<Handle>,
                               Trellis::TypeBuilder<Handle> &b)
    {
      b.Field<&Handle::value>("value");
      b.Constructor<int>();
    }
  };
} // namespace CtorDemo

TEST_CASE("DefaultConstructorProducesZeroPoint",
          "[trellis][Constructors]")
{
  using namespace Trellis;
  using CtorDemo::Point;

  auto t = GetType<Point>();
  CHECK(t.HasDefaultConstructor());
  auto any = t.DefaultConstruct().value();
  auto p = any.Cast<Point>();
  CHECK(p.x == 0);
  CHECK(p.y == 0);
}

TEST_CASE("ParameterizedConstructorAcceptsInts",
          "[trellis][Constructors]")
{
  using namespace Trellis;
  using CtorDemo::Point;

  auto t = GetType<Point>();
  Any args[2] = {Any{3}, Any{4}};
  auto any = t.Construct(args, 2).value();
  auto p = any.Cast<Point>();
  CHECK(p.x == 3);
  CHECK(p.y == 4);
}

TEST_CASE("ParameterizedConstructorConvertsArguments",
          "[trellis][Constructors]")
{
  using namespace Trellis;
  using CtorDemo::Point;

  auto t = GetType<Point>();
  Any args[2] = {Any{3.5}, Any{4.0f}};
  auto any = t.Construct(args, 2).value();
  auto p = any.Cast<Point>();
  CHECK(p.x == 3);
  CHECK(p.y == 4);
}

TEST_CASE("ConstructorReportsParameterTypes",
          "[trellis][Constructors]")
{
  using namespace Trellis;
  using CtorDemo::Point;

  auto t = GetType<Point>();
  REQUIRE(t.ConstructorCount() == 2);
  auto ctor = t.ConstructorAt(1);
  REQUIRE(ctor.ParameterCount() == 2);
  CHECK(ctor.ParameterTypeId(0) == GetType<int>().GetTypeId());
  CHECK(ctor.ParameterTypeId(1) == GetType<int>().GetTypeId());
  CHECK(ctor.ParameterTypeId(2) == 0);
}

TEST_CASE("TypeWithoutDefaultConstructorRejectsEmptyArguments",
          "[trellis][Constructors]")
{
  using namespace Trellis;
  using CtorDemo::Handle;

  auto t = GetType<Handle>();
  CHECK_FALSE(t.HasDefaultConstructor());
  CHECK_FALSE(t.DefaultConstruct().has_value());

  Any arg{9};
  auto any = t.Construct(&arg, 1).value();
  CHECK(any.Cast<Handle>().value == 9);
}
