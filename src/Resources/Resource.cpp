#include <Attest/Resources/Resource.hpp>
#include <Attest/Log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <utility>

namespace Attest::Resources
{

  Resource::Resource(BackendPtr backend, std::string name) : m_backend(std::move(backend)), m_name(std::move(name))
  {
  }

  std::expected<CommandResult, Error> Resource::Run(std::string_view command) const
  {
    ATTEST_LOG(Trace, "{}: {}", m_backend->Selector(), command);
    return m_backend->Run(command);
  }

  std::expected<bool, Error> Resource::RunTest(std::string_view command, std::initializer_list<int> falseStatuses) const
  {
    auto result = Run(command);
    if (!result)
      return std::unexpected(result.error());
    if (result->Succeeded())
      return true;
    if (std::find(falseStatuses.begin(), falseStatuses.end(), result->exitStatus) != falseStatuses.end())
      return false;
    return std::unexpected(Error{ErrorCode::ProviderFailure,
                                 fmt::format("command '{}' exited with status {}", command, result->exitStatus)});
  }

  std::expected<std::string, Error> Resource::CheckOutput(std::string_view command) const
  {
    auto result = Run(command);
    if (!result)
      return std::unexpected(result.error());
    if (!result->Succeeded())
      return std::unexpected(Error{ErrorCode::ProviderFailure,
                                   fmt::format("command '{}' exited with status {}", command, result->exitStatus)});
    auto out = std::move(result->stdoutText);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
      out.pop_back();
    return out;
  }

  std::expected<std::int64_t, Error> Resource::CheckInteger(std::string_view command, int base) const
  {
    auto out = CheckOutput(command);
    if (!out)
      return std::unexpected(out.error());
    const auto fields = SplitFields(*out);
    std::int64_t value = 0;
    if (fields.size() == 1)
    {
      const auto &text = fields.front();
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
      if (ec == std::errc{} && ptr == text.data() + text.size())
        return value;
    }
    return std::unexpected(Error{ErrorCode::ProviderFailure,
                                 fmt::format("command '{}' did not print an integer: {}", command, *out)});
  }

  std::vector<std::string> SplitFields(std::string_view text)
  {
    std::vector<std::string> fields;
    std::size_t i = 0;
    while (i < text.size())
    {
      while (i < text.size() && (text[i] == ' ' || text[i] == '\t' || text[i] == '\n' || text[i] == '\r'))
        ++i;
      const auto start = i;
      while (i < text.size() && text[i] != ' ' && text[i] != '\t' && text[i] != '\n' && text[i] != '\r')
        ++i;
      if (i > start)
        fields.emplace_back(text.substr(start, i - start));
    }
    return fields;
  }

  std::vector<std::string> SplitLines(std::string_view text)
  {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size())
    {
      auto end = text.find('\n', start);
      if (end == std::string_view::npos)
        end = text.size();
      auto line = text.substr(start, end - start);
      if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
      if (!line.empty())
        lines.emplace_back(line);
      start = end + 1;
    }
    return lines;
  }

} // namespace Attest::Resources
