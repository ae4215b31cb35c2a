// BaseMetadata.cpp - tests for base-class metadata and generic supertype edges

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <string>

namespace BaseDemo
{
  struct Base
  {
    int id{};
  };

  struct Tagged
  {
    Trellis::Any tag;
  };

  struct Derived : Base, Tagged
  {
    int value{};

    friend void TrellisReflect(Trellis::Tag<Derived>, Trellis::TypeBuilder<Derived> &b)
    {
      b.SetName("BaseDemo::Derived");
      b.Field<&Derived::value>("value");
      b.Base<Base>();
      b.Interface<Tagged>({Trellis::ClassOf<std::string>()});
    }
  };

  struct MoreDerived : Derived
  {
    friend void TrellisReflect(Trellis::Tag<MoreDerived>, Trellis::TypeBuilder<MoreDerived> &b)
    {
      b.SetName("BaseDemo::MoreDerived");
      b.Base<Derived>();
    }
  };

  inline void TrellisReflect(Trellis::Tag<Base>, Trellis::TypeBuilder<Base> &b)
  {
    b.SetName("BaseDemo::Base");
    b.Field<&Base::id>("id");
  }

  inline void TrellisReflect(Trellis::Tag<Tagged>, Trellis::TypeBuilder<Tagged> &b)
  {
    b.SetName("BaseDemo::Tagged");
    b.TypeParameter("T");
    b.Field<&Tagged::tag>("tag", b.Var("T"));
  }
} // namespace BaseDemo

TEST_CASE("BaseMetadataProvidesUpcast", "[trellis][Base]")
{
  using namespace Trellis;
  using BaseDemo::Derived;
  using BaseDemo::Tagged;

  auto t = GetType<Derived>();
  auto bt = GetType<BaseDemo::Base>();
  CHECK(t.BaseCount() == 2);
  CHECK(t.IsDerivedFrom(bt));

  Derived d{};
  d.id = 7;
  d.value = 11;
  d.tag = Any{3};

  auto base = t.BaseAt(0);
  auto *bp = static_cast<BaseDemo::Base *>(base.Upcast(&d));
  REQUIRE(bp != nullptr);
  CHECK(bp->id == 7);

  auto tagged = t.FindBase(GetType<Tagged>()).value();
  auto *tp = static_cast<Tagged *>(tagged.Upcast(&d));
  CHECK(tp == static_cast<Tagged *>(&d));
  CHECK(tp->tag.Cast<int>() == 3);
}

TEST_CASE("BaseEdgesSeparateSuperclassFromInterfaces", "[trellis][Base]")
{
  using namespace Trellis;
  using BaseDemo::Derived;
  using BaseDemo::Tagged;

  auto t = GetType<Derived>();
  auto super = t.GenericSuperclass();
  REQUIRE(super.has_value());
  CHECK(*super == ClassOf<BaseDemo::Base>());
  CHECK_FALSE(t.BaseAt(0).IsInterface());

  REQUIRE(t.GenericInterfaceCount() == 1);
  auto edge = t.GenericInterfaceAt(0);
  REQUIRE(edge.IsParameterized());
  CHECK(edge.RawType() == GetType<Tagged>());
  REQUIRE(edge.Arguments().Size() == 1);
  CHECK(edge.Arguments()[0] == ClassOf<std::string>());
  CHECK(t.BaseAt(1).IsInterface());
}

TEST_CASE("AssignabilityFollowsTransitiveBases", "[trellis][Base]")
{
  using namespace Trellis;

  auto base = GetType<BaseDemo::Base>();
  auto derived = GetType<BaseDemo::Derived>();
  auto more = GetType<BaseDemo::MoreDerived>();

  CHECK(more.IsDerivedFrom(base));
  CHECK(base.IsAssignableFrom(more));
  CHECK(base.IsAssignableFrom(base));
  CHECK(GetType<BaseDemo::Tagged>().IsAssignableFrom(more));
  CHECK_FALSE(more.IsAssignableFrom(derived));
  CHECK_FALSE(base.FindBase(derived).has_value());
  CHECK(base.GetBase(derived).error().code == ErrorCode::NotFound);
}

TEST_CASE("TypeParametersAreDeclaredInOrder", "[trellis][Base]")
{
  using namespace Trellis;

  auto tagged = GetType<BaseDemo::Tagged>();
  REQUIRE(tagged.TypeParameterCount() == 1);
  CHECK(tagged.TypeParameterAt(0).VariableName() == "T");
  CHECK(tagged.TypeParameterAt(0).DeclaringType() == tagged);
  CHECK(GetType<BaseDemo::Base>().TypeParameterCount() == 0);
  CHECK_FALSE(GetType<BaseDemo::Base>().GenericSuperclass().has_value());
}
