// Properties.cpp - tests for property registration and access

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <string>

namespace PropDemo {
struct User {
  int score{0};
  int GetScore() const { return score; }
  void SetScore(int v) { score = v; }
  friend void TrellisReflect(Trellis::Tag<User>, Trellis::TypeBuilder<User> &b) {
    b.SetName("PropDemo::User");
    b.Property<&User::GetScore, &User::SetScore>("score");
  }
};

struct RefProp {
  int value{0};
  int &Value() { return value; }
  friend void TrellisReflect(Trellis::Tag<RefProp>, Trellis::TypeBuilder<RefProp> &b) {
    b.Property<&RefProp::Value>("value");
  }
};

struct ReadOnly {
  int value{3};
  const int &Value() const { return value; }
  friend void TrellisReflect(Trellis::Tag<ReadOnly>, Trellis::TypeBuilder<ReadOnly> &b) {
    b.Property<&ReadOnly::Value>("value");
  }
};

struct Labelled {
  Trellis::Any label;
  const Trellis::Any &Label() const { return label; }
  void SetLabel(Trellis::Any v) { label = std::move(v); }
  friend void TrellisReflect(Trellis::Tag<Labelled>, Trellis::TypeBuilder<Labelled> &b) {
    b.TypeParameter("L");
    b.Property<&Labelled::Label, &Labelled::SetLabel>("label", b.Var("L"));
  }
};
} // namespace PropDemo

TEST_CASE("PropertyGetterSetterRoundTrip", "[trellis][Properties]") {
  using namespace Trellis;
  using PropDemo::User;

  auto t = GetType<User>();
  auto p = t.GetProperty("score").value();

  User u{7};
  CHECK(p.Get<int>(u).value() == 7);
  CHECK(p.Set(u, 12).has_value());
  CHECK(p.Get<int>(u).value() == 12);
  CHECK(p.CanRead());
  CHECK(p.CanWrite());
}

TEST_CASE("PropertyImplicitSetterFromRefGetter", "[trellis][Properties]") {
  using namespace Trellis;
  using PropDemo::RefProp;

  auto p = GetType<RefProp>().GetProperty("value").value();

  RefProp r{5};
  CHECK(p.Get<int>(r).value() == 5);
  CHECK(p.Set(r, 21).has_value());
  CHECK(r.value == 21);
  CHECK(p.GetMut(&r) == static_cast<void *>(&r.value));
}

TEST_CASE("PropertyReadOnlyRejectsSet", "[trellis][Properties]") {
  using namespace Trellis;
  using PropDemo::ReadOnly;

  auto p = GetType<ReadOnly>().GetProperty("value").value();

  ReadOnly r{};
  CHECK(p.Get<int>(r).value() == 3);
  CHECK_FALSE(p.CanWrite());
  CHECK_FALSE(p.Set(r, 9).has_value());
  CHECK(r.value == 3);
  CHECK_FALSE(p.SetterDeclaredType().IsValid());
}

TEST_CASE("PropertyDeclaredTypesDefaultToValueType", "[trellis][Properties]") {
  using namespace Trellis;
  using PropDemo::User;

  auto p = GetType<User>().GetProperty("score").value();
  CHECK(p.ValueType() == GetType<int>());
  CHECK(p.GetterDeclaredType() == ClassOf<int>());
  CHECK(p.SetterDeclaredType() == ClassOf<int>());
  CHECK(p.DeclaringType() == GetType<User>());
}

TEST_CASE("PropertyKeepsGenericDeclaration", "[trellis][Properties]") {
  using namespace Trellis;
  using PropDemo::Labelled;

  auto t = GetType<Labelled>();
  auto p = t.GetProperty("label").value();
  REQUIRE(p.GetterDeclaredType().IsVariable());
  CHECK(p.GetterDeclaredType().VariableName() == "L");
  CHECK(p.GetterDeclaredType().DeclaringType() == t);
  CHECK(p.SetterDeclaredType() == p.GetterDeclaredType());

  Labelled l{};
  CHECK(p.SetAny(l, Any{std::string{"tag"}}).has_value());
  CHECK(l.label.Cast<std::string>() == "tag");
}

TEST_CASE("MissingPropertyReportsNotFound", "[trellis][Properties]") {
  using namespace Trellis;
  auto t = GetType<PropDemo::User>();
  auto p = t.GetProperty("nope");
  REQUIRE_FALSE(p.has_value());
  CHECK(p.error().code == ErrorCode::NotFound);
  CHECK_FALSE(t.FindProperty("nope").has_value());
}
