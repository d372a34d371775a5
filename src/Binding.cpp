#include <Attest/Binding.hpp>

#include <algorithm>
#include <utility>

namespace Attest
{

  CheckList FilterReservedChecks(const CheckList &checks)
  {
    CheckList out;
    out.reserve(checks.size());
    for (const auto &check : checks)
    {
      if (!IsReservedCheckName(check.first))
        out.push_back(check);
    }
    return out;
  }

  BoundArguments BindArguments(const std::vector<std::string_view> &parameters, CheckList checks)
  {
    BoundArguments bound;
    bound.checks.reserve(checks.size());
    for (auto &check : checks)
    {
      const bool isParameter = std::find(parameters.begin(), parameters.end(), check.first) != parameters.end();
      if (isParameter)
        bound.constructorArgs.push_back(std::move(check));
      else
        bound.checks.push_back(std::move(check));
    }
    return bound;
  }

} // namespace Attest
