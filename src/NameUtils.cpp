#include <Attest/NameUtils.hpp>

#include <cctype>

namespace Attest
{

  namespace
  {
    bool IsUpper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
    bool IsLower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
    char ToLower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  } // namespace

  std::string CamelToSnake(std::string_view camel)
  {
    std::string out;
    if (camel.empty())
      return out;
    out.reserve(camel.size() + 4);
    out += ToLower(camel[0]);
    for (std::size_t i = 1; i < camel.size(); ++i)
    {
      const char c = camel[i];
      if (IsUpper(c))
      {
        // Start a new word after a lower-case letter, or at the last capital of an acronym.
        const bool afterLower = IsLower(camel[i - 1]);
        const bool beforeLower = i + 1 < camel.size() && IsLower(camel[i + 1]);
        if (afterLower || beforeLower)
          out += '_';
      }
      out += ToLower(c);
    }
    return out;
  }

} // namespace Attest
