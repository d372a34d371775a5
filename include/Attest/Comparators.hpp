// Comparators.hpp
// Fixed vocabulary of named binary predicates applied as comparator(expected, actual)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <expected>
#include <string_view>

#include <Attest/Export.hpp>
#include <Attest/Types.hpp>
#include <Attest/Value.hpp>

namespace Attest
{

  using ComparatorFn = std::expected<bool, Error> (*)(const Value &expected, const Value &actual);

  struct Comparator
  {
    std::string_view name;
    ComparatorFn Apply{nullptr};
  };

  /**
   * ComparatorRegistry
   *
   * Immutable after construction; `Default()` holds the built-in vocabulary:
   * eq, ne, lt, le, gt, ge, is_, is_not, contains, search.
   * Every predicate receives the declared expected value first.
   */
  class ATTEST_API ComparatorRegistry
  {
  public:
    [[nodiscard]] static const ComparatorRegistry &Default();

    // ComparatorNotFound for names outside the vocabulary.
    [[nodiscard]] std::expected<Comparator, Error> Resolve(std::string_view name) const;
    [[nodiscard]] bool Contains(std::string_view name) const noexcept;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept;
    [[nodiscard]] std::string_view NameAt(NGIN::UIntSize i) const noexcept;

  private:
    ComparatorRegistry();
    void Add(std::string_view name, ComparatorFn fn);
    [[nodiscard]] const Comparator *Lookup(std::string_view name) const noexcept;

    NGIN::Containers::Vector<Comparator> m_entries;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_index;
  };

  // Value equality as `eq` sees it: numeric kinds compare by value, containers element-wise.
  [[nodiscard]] ATTEST_API bool LooseEquals(const Value &a, const Value &b);

} // namespace Attest
