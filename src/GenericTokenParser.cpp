#include <Trellis/GenericTokenParser.hpp>

namespace Trellis
{

  std::string GenericTokenParser::Parse(std::string_view text) const
  {
    if (text.empty())
      return {};
    if (m_openToken.empty() || m_closeToken.empty())
      return std::string{text};

    auto start = text.find(m_openToken);
    if (start == std::string_view::npos)
      return std::string{text};

    std::string out;
    std::string expression;
    std::size_t offset = 0;
    while (start != std::string_view::npos)
    {
      if (start > 0 && text[start - 1] == '\\')
      {
        // Escaped open token: drop the backslash
        out.append(text.substr(offset, start - offset - 1)).append(m_openToken);
        offset = start + m_openToken.size();
      }
      else
      {
        expression.clear();
        out.append(text.substr(offset, start - offset));
        offset = start + m_openToken.size();
        auto end = text.find(m_closeToken, offset);
        while (end != std::string_view::npos)
        {
          if (end > offset && text[end - 1] == '\\')
          {
            expression.append(text.substr(offset, end - offset - 1)).append(m_closeToken);
            offset = end + m_closeToken.size();
            end = text.find(m_closeToken, offset);
          }
          else
          {
            expression.append(text.substr(offset, end - offset));
            break;
          }
        }
        if (end == std::string_view::npos)
        {
          out.append(text.substr(start));
          offset = text.size();
        }
        else
        {
          out.append(m_handler.HandleToken(expression));
          offset = end + m_closeToken.size();
        }
      }
      start = text.find(m_openToken, offset);
    }
    if (offset < text.size())
      out.append(text.substr(offset));
    return out;
  }

} // namespace Trellis
