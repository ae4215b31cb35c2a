#include <iostream>
#include <string>
#include <NGIN/Benchmark.hpp>
#include <Trellis/Trellis.hpp>

using namespace NGIN;

namespace ResolveBench
{
  struct Pair
  {
    Trellis::Any left;
    friend void TrellisReflect(Trellis::Tag<Pair>, Trellis::TypeBuilder<Pair> &b)
    {
      b.TypeParameter("K").TypeParameter("V");
      b.Field<&Pair::left>("left", b.Var("K"));
    }
  };

  struct Level1 : Pair
  {
    friend void TrellisReflect(Trellis::Tag<Level1>, Trellis::TypeBuilder<Level1> &b)
    {
      b.TypeParameter("A");
      b.Base<Pair>({b.Var("A"), Trellis::ClassOf<int>()});
    }
  };

  struct Level2 : Level1
  {
    friend void TrellisReflect(Trellis::Tag<Level2>, Trellis::TypeBuilder<Level2> &b)
    {
      b.TypeParameter("B");
      b.Base<Level1>({b.Var("B")});
    }
  };

  struct Leaf : Level2
  {
    friend void TrellisReflect(Trellis::Tag<Leaf>, Trellis::TypeBuilder<Leaf> &b)
    {
      b.Base<Level2>({Trellis::ClassOf<std::string>()});
    }
  };
}

int main()
{
  using namespace Trellis;

  auto left = GetType<ResolveBench::Pair>().GetField("left").value();
  const auto direct = ParameterizedOf<ResolveBench::Pair>({ClassOf<std::string>(), ClassOf<int>()});
  const auto leaf = ClassOf<ResolveBench::Leaf>();

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)ResolveFieldType(left, direct);
                        }
                        ctx.stop(); }, "ResolveFieldType direct 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                        {
                          (void)ResolveFieldType(left, leaf);
                        }
                        ctx.stop(); }, "ResolveFieldType three levels 10k");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
