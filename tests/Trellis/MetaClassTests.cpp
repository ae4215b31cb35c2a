// MetaClassTests.cpp - tests for type-level property path queries

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ClassDemo
{
  using Trellis::Any;
  using Trellis::Tag;
  using Trellis::TypeBuilder;

  struct Address
  {
    std::string city;
    int zip{0};
    friend void TrellisReflect(Tag<Address>, TypeBuilder<Address> &b)
    {
      b.SetName("ClassDemo::Address");
      b.Field<&Address::city>("city");
      b.Field<&Address::zip>("zip");
    }
  };

  struct Customer
  {
    std::string firstName;
    std::shared_ptr<Address> address;
    friend void TrellisReflect(Tag<Customer>, TypeBuilder<Customer> &b)
    {
      b.SetName("ClassDemo::Customer");
      b.Field<&Customer::firstName>("firstName");
      b.Field<&Customer::address>("address");
    }
  };

  struct Line
  {
    std::string sku;
    friend void TrellisReflect(Tag<Line>, TypeBuilder<Line> &b)
    {
      b.SetName("ClassDemo::Line");
      b.Field<&Line::sku>("sku");
    }
  };

  struct Order
  {
    std::optional<Customer> customer;
    std::vector<Any> lines;
    std::vector<Line> typedLines;
    std::map<std::string, Address> sites;
    int total{0};

    int Total() const { return total; }

    friend void TrellisReflect(Tag<Order>, TypeBuilder<Order> &b)
    {
      using namespace Trellis;
      b.SetName("ClassDemo::Order");
      b.Field<&Order::customer>("customer");
      b.Field<&Order::lines>("lines", ParameterizedOf<std::vector<Any>>({ClassOf<Line>()}));
      b.Field<&Order::typedLines>("typedLines");
      b.Field<&Order::sites>("sites");
      b.Property<&Order::Total>("grandTotal");
    }
  };

  struct Box
  {
    std::vector<Any> items;
    Any first;
    friend void TrellisReflect(Tag<Box>, TypeBuilder<Box> &b)
    {
      using namespace Trellis;
      b.SetName("ClassDemo::Box");
      b.TypeParameter("T");
      b.Field<&Box::items>("items", ParameterizedOf<std::vector<Any>>({b.Var("T")}));
      b.Field<&Box::first>("first", b.Var("T"));
    }
  };

  struct Crate : Box
  {
    friend void TrellisReflect(Tag<Crate>, TypeBuilder<Crate> &b)
    {
      b.SetName("ClassDemo::Crate");
      b.Base<Box>({Trellis::ClassOf<Address>()});
    }
  };
} // namespace ClassDemo

TEST_CASE("NestedGetterTypesFollowPointers", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  CHECK(meta.RawType() == GetType<Order>());
  CHECK(meta.GetGetterType("customer").value() == GetType<std::optional<Customer>>());
  CHECK(meta.GetGetterType("customer.firstName").value() == GetType<std::string>());
  CHECK(meta.GetGetterType("customer.address.city").value() == GetType<std::string>());
  CHECK(meta.GetSetterType("customer.address.zip").value() == GetType<int>());
}

TEST_CASE("IndexedSegmentsSelectElementTypes", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  CHECK(meta.GetGetterType("lines").value() == GetType<std::vector<Any>>());
  CHECK(meta.GetGetterType("lines[0]").value() == GetType<Line>());
  CHECK(meta.GetGetterType("lines[0].sku").value() == GetType<std::string>());
  CHECK(meta.GetGetterType("typedLines[3].sku").value() == GetType<std::string>());
  CHECK(meta.GetGetterType("sites[home].city").value() == GetType<std::string>());
}

TEST_CASE("MissingSegmentsReportNotFound", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  auto r = meta.GetGetterType("customer.nickname");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::NotFound);
  CHECK(meta.GetSetterType("grandTotal").error().code == ErrorCode::NotFound);
  CHECK_FALSE(meta.MetaClassForProperty("nothing.here").has_value());
}

TEST_CASE("HasGetterAndHasSetterWalkPaths", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  CHECK(meta.HasGetter("customer.address.city"));
  CHECK(meta.HasSetter("customer.address.city"));
  CHECK(meta.HasGetter("grandTotal"));
  CHECK_FALSE(meta.HasSetter("grandTotal"));
  CHECK_FALSE(meta.HasGetter("customer.nickname"));
  CHECK_FALSE(meta.HasSetter("missing.city"));
  CHECK(meta.HasGetter("lines[0].sku"));
}

TEST_CASE("FindPropertyRestoresCanonicalCase", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  CHECK(meta.FindProperty("CUSTOMER.ADDRESS.CITY").value() == "customer.address.city");
  CHECK(meta.FindProperty("customer.FIRSTNAME").value() == "customer.firstName");
  CHECK_FALSE(meta.FindProperty("customer.first_name").has_value());
  CHECK(meta.FindProperty("customer.first_name", true).value() == "customer.firstName");
  // A partial match is not a match
  CHECK_FALSE(meta.FindProperty("customer.address.street").has_value());
}

TEST_CASE("GetterAndSetterNamesListMembers", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto meta = MetaClass::ForType(GetType<Order>());
  const auto &getters = meta.GetGetterNames();
  const auto &setters = meta.GetSetterNames();
  CHECK(getters.Size() == 5);
  CHECK(setters.Size() == 4);
  bool sawTotal = false;
  for (NGIN::UIntSize i = 0; i < getters.Size(); ++i)
    sawTotal = sawTotal || getters[i] == "grandTotal";
  CHECK(sawTotal);
  CHECK(meta.HasDefaultConstructor());
}

TEST_CASE("ParameterizedContextResolvesMemberTypes", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto boxed = MetaClass::ForContext(ParameterizedOf<Box>({ClassOf<std::string>()}));
  CHECK(boxed.GetGetterType("items[0]").value() == GetType<std::string>());
  CHECK(boxed.GetGetterType("first").value() == GetType<std::string>());
  CHECK(boxed.GetGenericGetterType("items").value() ==
        ParameterizedOf<std::vector<Any>>({ClassOf<std::string>()}));

  auto raw = MetaClass::ForType(GetType<Box>());
  CHECK(raw.GetGetterType("items[0]").value() == GetType<Any>());
  CHECK(raw.GetGetterType("first").value() == GetType<Any>());
}

TEST_CASE("SubclassContextBindsInheritedMembers", "[trellis][MetaClass]")
{
  using namespace Trellis;
  using namespace ClassDemo;

  auto crate = MetaClass::ForType(GetType<Crate>());
  CHECK(crate.GetGetterType("first").value() == GetType<Address>());
  CHECK(crate.GetGetterType("items[0].city").value() == GetType<std::string>());
  CHECK(crate.HasSetter("first.zip"));

  auto child = crate.MetaClassForProperty("first").value();
  CHECK(child.RawType() == GetType<Address>());
  CHECK(child.HasGetter("zip"));
}
