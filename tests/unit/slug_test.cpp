#include "internal/text/slug.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using adrgen::text::Slugify;

void TestLowercasesAndMapsSeparators() {
  assert(Slugify("Hello World") == "hello-world");
  assert(Slugify("DATABASE_CHOICE") == "database-choice");
  assert(Slugify("microservice architecture") == "microservice-architecture");
  assert(Slugify("Already-Kebab-Case") == "already-kebab-case");
}

void TestEmptyTitleGivesEmptySlug() {
  assert(Slugify("").empty());
}

void TestNoFurtherNormalization() {
  assert(Slugify("Multiple   Spaces") == "multiple---spaces");
  assert(Slugify(" leading and trailing ") == "-leading-and-trailing-");
  assert(Slugify("Use gRPC (v2)!") == "use-grpc-(v2)!");
  assert(Slugify("\xC3\x89" "dition_Sp\xC3\xA9" "ciale") == "\xC3\x89" "dition-sp\xC3\xA9" "ciale");
}

void TestNormalizedInputIsFixedPoint() {
  const std::vector<std::string> normalized = {"hello-world", "", "a--b", "-x-", "v2.0-release", "caf\xC3\xA9"};
  for (const auto& slug : normalized) {
    assert(Slugify(slug) == slug);
    assert(Slugify(Slugify(slug)) == slug);
  }
}

} // namespace

int main() {
  TestLowercasesAndMapsSeparators();
  TestEmptyTitleGivesEmptySlug();
  TestNoFurtherNormalization();
  TestNormalizedInputIsFixedPoint();

  std::cout << "adrgen_unit_slug: pass\n";
  return 0;
}
