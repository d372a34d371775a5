#include <Attest/Attest.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace Demo {
  // A resource that needs no backend commands: reports on a fixed value.
  class Answer {
  public:
    Answer(Attest::BackendPtr, std::string name) : m_name(std::move(name)) {}

    bool IsKnown() const { return m_name == "life"; }
    std::int64_t Number() const { return 42; }
    bool Equals(std::int64_t v) const { return v == 42; }

    friend void AttestDescribe(Attest::Tag<Answer>, Attest::ResourceBuilder<Answer> &b) {
      b.SetName("Answer");
      b.Constructor();
      b.Property<&Answer::IsKnown>("is_known");
      b.Property<&Answer::Number>("value");
      b.Method<&Answer::Equals>("equals");
    }

  private:
    std::string m_name;
  };
}

int main() {
  std::cout << "Library: " << Attest::LibraryName() << "\n";

  (void)Attest::GetResourceType<Demo::Answer>();

  Attest::CheckList checks{
      {"is_known", true},
      {"value", Attest::ValueMap{{"comparison", "ge"}, {"expected", 40}}},
      {"equals", Attest::ValueMap{{"parameter", 42}, {"expected", true}, {"comparison", "is_"}}},
  };

  auto report = Attest::VerifyResource("answer", "life", checks);
  if (!report) {
    std::cerr << report.error().message << "\n";
    return 2;
  }
  for (const auto &m : report->passed)
    std::cout << m << "\n";
  for (const auto &m : report->failed)
    std::cout << m << "\n";

  // Built-in providers are reachable through the entry-point table.
  for (const auto name : Attest::EntryPoints().Names())
    std::cout << "entry point: " << name << "\n";

  return report->success ? 0 : 1;
}
