// GenericTokenParser.hpp
// Replaces open/close delimited expressions ("${name}") with handler output
#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <Trellis/Export.hpp>

namespace Trellis
{

  class TRELLIS_API TokenHandler
  {
  public:
    virtual ~TokenHandler() = default;
    [[nodiscard]] virtual std::string HandleToken(std::string_view expression) = 0;
  };

  // A backslash before an open token emits the token literally. Inside an
  // expression, a backslash before a close token keeps it as expression text.
  // An expression without a close token is copied through unchanged.
  class TRELLIS_API GenericTokenParser
  {
  public:
    GenericTokenParser(std::string openToken, std::string closeToken, TokenHandler &handler)
        : m_openToken(std::move(openToken)), m_closeToken(std::move(closeToken)), m_handler(handler)
    {
    }

    [[nodiscard]] std::string Parse(std::string_view text) const;

  private:
    std::string m_openToken;
    std::string m_closeToken;
    TokenHandler &m_handler;
  };

} // namespace Trellis
