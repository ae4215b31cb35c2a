// PropertyTokenizer.hpp
// Splits a property path ("order.items[0].price") into its first segment and the remainder
#pragma once

#include <string>
#include <string_view>

#include <Trellis/Export.hpp>

namespace Trellis
{

  // One step of a property path. The first '.' outside an index bracket ends the
  // segment; "name[key]" carries an index key. Malformed brackets are taken
  // literally as part of the name.
  class TRELLIS_API PropertyTokenizer
  {
  public:
    PropertyTokenizer() = default;
    explicit PropertyTokenizer(std::string_view path);

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] std::string_view Index() const noexcept { return m_index; }
    [[nodiscard]] bool HasIndex() const noexcept { return m_hasIndex; }
    // "name[key]" as written, or just the name
    [[nodiscard]] std::string_view IndexedName() const noexcept { return m_indexedName; }
    [[nodiscard]] std::string_view Children() const noexcept { return m_children; }
    [[nodiscard]] bool HasNext() const noexcept { return m_hasNext; }

    // Tokenizer over the remainder
    [[nodiscard]] PropertyTokenizer Next() const { return PropertyTokenizer{m_children}; }

  private:
    std::string m_name;
    std::string m_index;
    std::string m_indexedName;
    std::string m_children;
    bool m_hasIndex{false};
    bool m_hasNext{false};
  };

} // namespace Trellis
