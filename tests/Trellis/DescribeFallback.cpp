// DescribeFallback.cpp - tests for describing types that cannot be modified

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <utility>

// Provide a Describe<T> specialization for a 3rd-party type we can't modify
namespace Trellis
{
  template <>
  struct Describe<std::pair<int, int>>
  {
    static void Do(TypeBuilder<std::pair<int, int>> &b)
    {
      b.SetName("std::pair<int,int>");
      b.Field<&std::pair<int, int>::first>("first");
      b.Field<&std::pair<int, int>::second>("second");
    }
  };
} // namespace Trellis

TEST_CASE("DescribeFallbackExposesFields", "[trellis][DescribeFallback]")
{
  using namespace Trellis;

  auto t = GetType<std::pair<int, int>>();
  CHECK(t.FieldCount() == NGIN::UIntSize{2});
  CHECK(t.QualifiedName() == "std::pair<int,int>");

  auto fFirst = t.GetField("first").value();
  auto fSecond = t.GetField("second").value();

  std::pair<int, int> p{0, 0};
  CHECK(fFirst.SetAny(&p, Any{42}).has_value());
  CHECK(fSecond.SetAny(&p, Any{7}).has_value());

  CHECK(p.first == 42);
  CHECK(p.second == 7);

  CHECK(fFirst.GetAny(&p).Cast<int>() == 42);
  CHECK(fSecond.GetAny(&p).Cast<int>() == 7);
}

TEST_CASE("DescribeAppliesCvrefNormalization",
          "[trellis][DescribeFallback]")
{
  using namespace Trellis;

  auto t0 = GetType<std::pair<int, int>>();
  auto t1 = GetType<const std::pair<int, int> &>();

  CHECK(t0.GetTypeId() == t1.GetTypeId());
  CHECK(t0 == t1);
}

TEST_CASE("DescribedTypeIsNavigable", "[trellis][DescribeFallback]")
{
  using namespace Trellis;

  std::pair<int, int> p{1, 2};
  auto meta = SystemMetaObject::ForObject(p);
  CHECK(meta->GetValueAs<int>("second").value() == 2);
  CHECK(meta->SetValue("first", Any{10}).has_value());
  CHECK(p.first == 10);
}
