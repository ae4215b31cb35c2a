// ObjectFactoryTests.cpp - tests for instantiating registered types

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace FactoryDemo
{
  struct Money
  {
    long cents{0};
    std::string currency{"EUR"};
    Money() = default;
    Money(long c, std::string cur) : cents(c), currency(std::move(cur)) {}
    explicit Money(double amount) : cents(static_cast<long>(amount * 100.0)) {}

    friend void TrellisReflect(Trellis::Tag<Money>, Trellis::TypeBuilder<Money> &b)
    {
      b.SetName("FactoryDemo::Money");
      b.Field<&Money::cents>("cents");
      b.Field<&Money::currency>("currency");
      b.Constructor<long, std::string>();
      b.Constructor<double>();
    }
  };

  // Counts requests and hands everything else to the default factory
  class CountingFactory : public Trellis::ObjectFactory
  {
  public:
    using ObjectFactory::Create;

    std::expected<Trellis::Any, Trellis::Error> Create(const Trellis::Type &type,
                                                       std::span<const Trellis::Type> argTypes,
                                                       std::span<const Trellis::Any> args) override
    {
      ++requests;
      return m_inner.Create(type, argTypes, args);
    }
    bool IsCollection(const Trellis::Type &type) const override { return m_inner.IsCollection(type); }

    int requests{0};

  private:
    Trellis::DefaultObjectFactory m_inner;
  };

  struct Invoice
  {
    std::optional<Money> total;
    friend void TrellisReflect(Trellis::Tag<Invoice>, Trellis::TypeBuilder<Invoice> &b)
    {
      b.SetName("FactoryDemo::Invoice");
      b.Field<&Invoice::total>("total");
    }
  };
} // namespace FactoryDemo

TEST_CASE("FactoryDefaultConstructsWithoutArguments", "[trellis][ObjectFactory]")
{
  using namespace Trellis;
  using FactoryDemo::Money;

  DefaultObjectFactory factory;
  auto money = factory.Create(GetType<Money>()).value();
  CHECK(money.Cast<Money>().cents == 0);
  CHECK(money.Cast<Money>().currency == "EUR");
}

TEST_CASE("FactoryPicksTheRequestedSignature", "[trellis][ObjectFactory]")
{
  using namespace Trellis;
  using FactoryDemo::Money;

  DefaultObjectFactory factory;
  const Type types[] = {GetType<long>(), GetType<std::string>()};
  const Any args[] = {Any{250L}, Any{std::string{"NOK"}}};
  auto money = factory.Create(GetType<Money>(), types, args).value().Cast<Money>();
  CHECK(money.cents == 250);
  CHECK(money.currency == "NOK");

  const Type single[] = {GetType<double>()};
  const Any amount[] = {Any{1.5}};
  CHECK(factory.Create(GetType<Money>(), single, amount).value().Cast<Money>().cents == 150);
}

TEST_CASE("FactoryRejectsMismatchedArguments", "[trellis][ObjectFactory]")
{
  using namespace Trellis;
  using FactoryDemo::Money;

  DefaultObjectFactory factory;
  const Type types[] = {GetType<long>()};
  const Any args[] = {Any{1L}, Any{2L}};
  auto r = factory.Create(GetType<Money>(), types, args);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
  CHECK(factory.Create(Type{}).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FactoryInstantiatesTopAsStringKeyedMap", "[trellis][ObjectFactory]")
{
  using namespace Trellis;
  using Dict = std::map<std::string, Any>;

  DefaultObjectFactory factory;
  auto created = factory.Create(GetType<Any>()).value();
  CHECK(created.GetTypeId() == GetType<Dict>().GetTypeId());
  CHECK(created.Cast<Dict>().empty());
}

TEST_CASE("FactoryReportsCollections", "[trellis][ObjectFactory]")
{
  using namespace Trellis;

  DefaultObjectFactory factory;
  CHECK(factory.IsCollection(GetType<std::vector<int>>()));
  CHECK_FALSE(factory.IsCollection(GetType<std::map<std::string, int>>()));
  CHECK_FALSE(factory.IsCollection(GetType<FactoryDemo::Money>()));
  CHECK_FALSE(factory.IsCollection(Type{}));
}

TEST_CASE("NavigatorUsesTheSuppliedFactory", "[trellis][ObjectFactory]")
{
  using namespace Trellis;
  using FactoryDemo::Invoice;

  FactoryDemo::CountingFactory factory;
  MetadataCache cache;
  Invoice invoice{};
  auto meta = MetaObject::ForObject(ObjectRef::Of(invoice), factory, SystemMetaObject::DefaultWrapperFactory(), cache);
  CHECK(&meta->GetObjectFactory() == &factory);

  CHECK(meta->SetValue("total.currency", Any{std::string{"SEK"}}).has_value());
  CHECK(factory.requests == 1);
  REQUIRE(invoice.total.has_value());
  CHECK(invoice.total->currency == "SEK");

  CHECK(meta->SetValue("total.cents", Any{99}).has_value());
  CHECK(factory.requests == 1);
  CHECK(invoice.total->cents == 99);
}
