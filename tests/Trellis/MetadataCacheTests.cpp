// MetadataCacheTests.cpp - tests for flattened per-type accessor tables and their cache

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace CacheDemo
{
  struct Root
  {
    int id{1};
    int value{2};
  };

  struct Mixin
  {
    int weight{3};
  };

  struct Node : Root, Mixin
  {
    int id{10};
    int cached{20};

    int Value() const { return cached; }
    void SetValue(int v) { cached = v; }

    friend void TrellisReflect(Trellis::Tag<Node>, Trellis::TypeBuilder<Node> &b)
    {
      b.SetName("CacheDemo::Node");
      b.Field<&Node::id>("id");
      b.Field<&Node::cached>("cached");
      b.Property<&Node::Value, &Node::SetValue>("value");
      b.Base<Root>();
      b.Base<Mixin>();
    }
  };

  struct Gauge
  {
    int level{0};
    const int &Level() const { return level; }
    friend void TrellisReflect(Trellis::Tag<Gauge>, Trellis::TypeBuilder<Gauge> &b)
    {
      b.SetName("CacheDemo::Gauge");
      b.Property<&Gauge::Level>("level");
    }
  };

  inline void TrellisReflect(Trellis::Tag<Root>, Trellis::TypeBuilder<Root> &b)
  {
    b.Field<&Root::id>("id");
    b.Field<&Root::value>("value");
  }

  inline void TrellisReflect(Trellis::Tag<Mixin>, Trellis::TypeBuilder<Mixin> &b)
  {
    b.Field<&Mixin::weight>("weight");
  }
} // namespace CacheDemo

TEST_CASE("CacheReturnsTheSameEntry", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  MetadataCache cache;
  auto t = GetType<CacheDemo::Node>();
  auto first = cache.FindForType(t);
  auto second = cache.FindForType(t);
  CHECK(first == second);
  CHECK(first->DescribedType() == t);

  MetadataCache other;
  CHECK(other.FindForType(t) != first);
}

TEST_CASE("DisabledCacheBuildsFreshEntries", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  MetadataCache cache;
  CHECK(cache.IsCacheEnabled());
  cache.SetCacheEnabled(false);
  auto t = GetType<CacheDemo::Node>();
  auto first = cache.FindForType(t);
  auto second = cache.FindForType(t);
  CHECK(first != second);
  CHECK(first->GetterNames().Size() == second->GetterNames().Size());
}

TEST_CASE("InheritedMembersAreFlattened", "[trellis][MetadataCache]")
{
  using namespace Trellis;
  using CacheDemo::Node;

  MetadataCache cache;
  auto meta = cache.FindForType(GetType<Node>());
  CHECK(meta->HasGetter("id"));
  CHECK(meta->HasGetter("value"));
  CHECK(meta->HasGetter("cached"));
  CHECK(meta->HasGetter("weight"));
  CHECK(meta->HasSetter("weight"));
  CHECK_FALSE(meta->HasGetter("missing"));
  // Each name appears once even when a base declares it too
  CHECK(meta->GetterNames().Size() == 4);
}

TEST_CASE("OwnMembersShadowBaseMembers", "[trellis][MetadataCache]")
{
  using namespace Trellis;
  using CacheDemo::Node;

  MetadataCache cache;
  auto meta = cache.FindForType(GetType<Node>());

  const auto *id = meta->FindGetter("id");
  REQUIRE(id != nullptr);
  CHECK(id->DeclaringType() == GetType<Node>());

  // A property wins over a field of the same name
  const auto *value = meta->FindGetter("value");
  REQUIRE(value != nullptr);
  CHECK(value->kind == MemberKind::Property);

  Node n{};
  CHECK(id->Load(&n).Cast<int>() == 10);
  CHECK(value->Load(&n).Cast<int>() == 20);
  CHECK(meta->FindSetter("value")->Store(&n, Any{21}).has_value());
  CHECK(n.cached == 21);
  CHECK(n.Root::value == 2);
}

TEST_CASE("BaseAccessorsUpcastThroughTheChain", "[trellis][MetadataCache]")
{
  using namespace Trellis;
  using CacheDemo::Node;

  MetadataCache cache;
  auto meta = cache.FindForType(GetType<Node>());
  const auto *weight = meta->FindSetter("weight");
  REQUIRE(weight != nullptr);
  CHECK(weight->DeclaringType() == GetType<CacheDemo::Mixin>());
  REQUIRE(weight->upcasts.Size() == 1);

  Node n{};
  CHECK(weight->Address(&n) == static_cast<void *>(&n.weight));
  CHECK(weight->Store(&n, Any{7}).has_value());
  CHECK(n.weight == 7);
  CHECK(weight->Load(&n).Cast<int>() == 7);
}

TEST_CASE("ReadOnlyPropertiesHaveNoSetter", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  MetadataCache cache;
  auto meta = cache.FindForType(GetType<CacheDemo::Gauge>());
  CHECK(meta->HasGetter("level"));
  CHECK_FALSE(meta->HasSetter("level"));
  CHECK(meta->SetterNames().Size() == 0);
  // By-value property getters have no address
  CacheDemo::Gauge g{};
  CHECK(meta->FindGetter("level")->Address(&g) == nullptr);
}

TEST_CASE("PropertyNamesMatchCaseInsensitively", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  MetadataCache cache;
  auto meta = cache.FindForType(GetType<CacheDemo::Node>());
  CHECK(meta->FindPropertyName("WEIGHT").value() == "weight");
  CHECK(meta->FindPropertyName("Cached").value() == "cached");
  CHECK_FALSE(meta->FindPropertyName("nothing").has_value());
  CHECK_FALSE(meta->FindPropertyName("weigh").has_value());

  // Exact-name tables stay case sensitive
  CHECK(meta->FindGetter("weight") != nullptr);
  CHECK(meta->FindGetter("WEIGHT") == nullptr);
  CHECK(meta->FindSetter("neverRegisteredAnywhere") == nullptr);
}

TEST_CASE("DefaultConstructorIsReported", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  MetadataCache cache;
  CHECK(cache.FindForType(GetType<CacheDemo::Node>())->HasDefaultConstructor());

  auto invalid = cache.FindForType(Type{});
  CHECK(invalid->GetterNames().Size() == 0);
  CHECK_FALSE(invalid->HasDefaultConstructor());
}

TEST_CASE("ConcurrentLookupsShareOneEntry", "[trellis][MetadataCache]")
{
  using namespace Trellis;

  // Registration happens up front; lookups from worker threads only read the registry
  auto t = GetType<CacheDemo::Node>();
  MetadataCache cache;

  constexpr int kThreads = 8;
  constexpr int kLookups = 500;
  std::vector<std::shared_ptr<const ClassMetadata>> seen(kThreads);
  std::atomic<int> mismatches{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < kThreads; ++i)
  {
    workers.emplace_back([&, i]
                         {
      seen[i] = cache.FindForType(t);
      for (int n = 0; n < kLookups; ++n)
      {
        if (cache.FindForType(t) != seen[i])
          mismatches.fetch_add(1, std::memory_order_relaxed);
      } });
  }
  for (auto &w : workers)
    w.join();

  CHECK(mismatches.load() == 0);
  for (int i = 1; i < kThreads; ++i)
    CHECK(seen[i] == seen[0]);
}
