// GenericTokenParserTests.cpp - tests for ${...} placeholder substitution

#include <catch2/catch_test_macros.hpp>

#include <Trellis/Trellis.hpp>

#include <map>
#include <string>
#include <utility>

namespace TokenDemo
{
  using Values = std::map<std::string, std::string>;

  class MapTokenHandler : public Trellis::TokenHandler
  {
  public:
    explicit MapTokenHandler(Values values) : m_values(std::move(values)) {}

    std::string HandleToken(std::string_view expression) override
    {
      ++calls;
      auto it = m_values.find(std::string{expression});
      return it == m_values.end() ? std::string{} : it->second;
    }

    int calls{0};

  private:
    Values m_values;
  };

  // Reads each expression as a property path of a bound object
  class PathTokenHandler : public Trellis::TokenHandler
  {
  public:
    explicit PathTokenHandler(Trellis::MetaObject &meta) : m_meta(meta) {}

    std::string HandleToken(std::string_view expression) override
    {
      auto value = m_meta.GetValueAs<std::string>(expression);
      return value ? *value : std::string{"?"};
    }

  private:
    Trellis::MetaObject &m_meta;
  };

  struct Crew
  {
    std::string captain;
    std::map<std::string, Trellis::Any> ship;
    friend void TrellisReflect(Trellis::Tag<Crew>, Trellis::TypeBuilder<Crew> &b)
    {
      b.SetName("TokenDemo::Crew");
      b.Field<&Crew::captain>("captain");
      b.Field<&Crew::ship>("ship");
    }
  };
} // namespace TokenDemo

TEST_CASE("ParserReplacesEveryPlaceholder", "[trellis][GenericTokenParser]")
{
  TokenDemo::MapTokenHandler handler{TokenDemo::Values{{"first_name", "James"}, {"initial", "T"}, {"last_name", "Kirk"}}};
  Trellis::GenericTokenParser parser{"${", "}", handler};

  CHECK(parser.Parse("${first_name} ${initial} ${last_name} reporting.") == "James T Kirk reporting.");
  CHECK(parser.Parse("Hello captain ${first_name}") == "Hello captain James");
  CHECK(parser.Parse("${first_name}${last_name}") == "JamesKirk");
  CHECK(parser.Parse("${missing}!") == "!");
  CHECK(parser.Parse("no placeholders") == "no placeholders");
}

TEST_CASE("EscapedOpenTokenIsKeptLiterally", "[trellis][GenericTokenParser]")
{
  TokenDemo::MapTokenHandler handler{TokenDemo::Values{{"var", "value"}}};
  Trellis::GenericTokenParser parser{"${", "}", handler};

  CHECK(parser.Parse("\\${skipped} variable") == "${skipped} variable");
  CHECK(parser.Parse("\\${skipped} ${var}") == "${skipped} value");
  CHECK(handler.calls == 1);
}

TEST_CASE("EscapedCloseTokenStaysInExpression", "[trellis][GenericTokenParser]")
{
  TokenDemo::MapTokenHandler handler{TokenDemo::Values{{"var{with}brace", "ok"}}};
  Trellis::GenericTokenParser parser{"${", "}", handler};

  CHECK(parser.Parse("${var{with\\}brace}") == "ok");
}

TEST_CASE("UnterminatedPlaceholderIsCopied", "[trellis][GenericTokenParser]")
{
  TokenDemo::MapTokenHandler handler{TokenDemo::Values{{"a", "A"}}};
  Trellis::GenericTokenParser parser{"${", "}", handler};

  CHECK(parser.Parse("${") == "${");
  CHECK(parser.Parse("}") == "}");
  CHECK(parser.Parse("x ${a") == "x ${a");
  CHECK(parser.Parse("${a} ${a") == "A ${a");
  CHECK(parser.Parse("") == "");
  CHECK(handler.calls == 1);
}

TEST_CASE("EmptyDelimitersLeaveTextUnchanged", "[trellis][GenericTokenParser]")
{
  TokenDemo::MapTokenHandler handler{TokenDemo::Values{}};
  Trellis::GenericTokenParser parser{"", "}", handler};
  CHECK(parser.Parse("${a}") == "${a}");
  CHECK(handler.calls == 0);
}

TEST_CASE("HandlerCanReadPropertyPaths", "[trellis][GenericTokenParser]")
{
  using namespace Trellis;

  TokenDemo::Crew crew{};
  crew.captain = "Kirk";
  crew.ship["name"] = Any{std::string{"Enterprise"}};

  auto meta = SystemMetaObject::ForObject(crew);
  TokenDemo::PathTokenHandler handler{*meta};
  GenericTokenParser parser{"${", "}", handler};

  CHECK(parser.Parse("${captain} of the ${ship.name}") == "Kirk of the Enterprise");
  CHECK(parser.Parse("${ship.registry}") == "?");
}
