#include <Attest/Resolver.hpp>

#include <fmt/format.h>

namespace Attest
{

  ExpectedResourceType ResolveResource(std::string_view typeName, const Backend &backend)
  {
    auto type = FindResourceTypeByEntryName(typeName);
    if (!type)
      return std::unexpected(Error{ErrorCode::UnsupportedResource,
                                   fmt::format("The {} resource is not provided for backend {}", typeName,
                                               backend.Selector())});
    if (!type->IsSupportedOn(backend))
      return std::unexpected(Error{ErrorCode::UnsupportedResource,
                                   fmt::format("The {} resource is not supported for this backend and/or platform.",
                                               typeName)});
    return *type;
  }

} // namespace Attest
