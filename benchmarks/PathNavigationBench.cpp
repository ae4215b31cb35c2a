#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <NGIN/Benchmark.hpp>
#include <Trellis/Trellis.hpp>

using namespace NGIN;

namespace PathBench
{
  struct Address
  {
    std::string city{"Oslo"};
    int zip{150};

    friend void TrellisReflect(Trellis::Tag<Address>, Trellis::TypeBuilder<Address> &b)
    {
      b.Field<&Address::city>("city");
      b.Field<&Address::zip>("zip");
    }
  };

  struct Customer
  {
    std::string name{"Ada"};
    std::shared_ptr<Address> address{std::make_shared<Address>()};
    std::map<std::string, Trellis::Any> extra;

    friend void TrellisReflect(Trellis::Tag<Customer>, Trellis::TypeBuilder<Customer> &b)
    {
      b.Field<&Customer::name>("name");
      b.Field<&Customer::address>("address");
      b.Field<&Customer::extra>("extra");
    }
  };
}

int main()
{
  using namespace Trellis;
  using PathBench::Customer;

  Customer customer{};
  customer.extra["tier"] = Any{std::string{"gold"}};
  auto meta = SystemMetaObject::ForObject(customer);

  // Warmup: builds the cached metadata for every type on the path
  (void)meta->GetValue("address.zip");

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)meta->GetValue("name");
                        }
                        ctx.stop(); }, "GetValue(name) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)meta->GetValue("address.zip");
                        }
                        ctx.stop(); }, "GetValue(address.zip) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int failures = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          failures += meta->SetValue("extra.tier", Any{i}).has_value() ? 0 : 1;
                        }
                        ctx.doNotOptimize(failures);
                        ctx.stop(); }, "SetValue(extra.tier) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        auto metaClass = MetaClass::ForType(GetType<Customer>());
                        ctx.start();
                        int misses = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          misses += metaClass.HasGetter("address.street") ? 0 : 1;
                        }
                        ctx.doNotOptimize(misses);
                        ctx.stop(); }, "MetaClass::HasGetter 10k misses");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
