#include <Trellis/PropertyTokenizer.hpp>

namespace Trellis
{

  PropertyTokenizer::PropertyTokenizer(std::string_view path)
  {
    std::string_view segment = path;
    bool inBracket = false;
    for (std::size_t i = 0; i < path.size(); ++i)
    {
      const char c = path[i];
      if (c == '[')
        inBracket = true;
      else if (c == ']')
        inBracket = false;
      else if (c == '.' && !inBracket)
      {
        segment = path.substr(0, i);
        m_children = std::string{path.substr(i + 1)};
        m_hasNext = true;
        break;
      }
    }

    m_indexedName = std::string{segment};
    const auto open = segment.find('[');
    if (open != std::string_view::npos && segment.size() > open + 1 && segment.back() == ']')
    {
      m_name = std::string{segment.substr(0, open)};
      m_index = std::string{segment.substr(open + 1, segment.size() - open - 2)};
      m_hasIndex = true;
    }
    else
    {
      m_name = m_indexedName;
    }
  }

} // namespace Trellis
