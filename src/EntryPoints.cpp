#include <Attest/EntryPoints.hpp>
#include <Attest/Log.hpp>
#include <Attest/Registry.hpp>
#include <Attest/Resources/Resources.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <utility>

namespace Attest
{

  namespace
  {
    NGIN::UInt64 HashName(std::string_view name)
    {
      return NGIN::Hashing::FNV1a64(name.data(), name.size());
    }
  } // namespace

  EntryPointTable EntryPointTable::Build(std::string backend)
  {
    return EntryPointTable{std::move(backend)};
  }

  EntryPointTable::EntryPointTable(std::string backend) : m_backend(std::move(backend))
  {
    const auto count = ResourceTypeCount();
    m_entries.Reserve(count);
    for (NGIN::UIntSize i = 0; i < count; ++i)
    {
      const auto type = ResourceTypeAt(i);
      const auto owner = FindResourceTypeByEntryName(type.TypeName());
      if (!owner || owner->Handle().index != type.Handle().index)
        continue;
      std::string name{type.TypeName()};
      ATTEST_LOG(Debug, "Generating entry point {}", name);
      EntryPoint entry{};
      entry.name = name;
      entry.description = type.Description();
      entry.run = [name, backend = m_backend](std::string_view subject, const CheckList &checks)
      { return VerifyResource(name, subject, checks, backend); };
      m_entries.PushBack(std::move(entry));
      m_index.Insert(HashName(m_entries[m_entries.Size() - 1].name), static_cast<NGIN::UInt32>(m_entries.Size() - 1));
    }
  }

  const EntryPoint *EntryPointTable::Find(std::string_view name) const noexcept
  {
    const auto *idx = m_index.GetPtr(HashName(name));
    if (!idx || m_entries[*idx].name != name)
      return nullptr;
    return &m_entries[*idx];
  }

  std::vector<std::string_view> EntryPointTable::Names() const
  {
    std::vector<std::string_view> names;
    names.reserve(m_entries.Size());
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
      names.push_back(m_entries[i].name);
    return names;
  }

  const EntryPointTable &EntryPoints()
  {
    static const EntryPointTable table = []
    {
      RegisterBuiltinResources();
      return EntryPointTable::Build();
    }();
    return table;
  }

} // namespace Attest
