#include "internal/text/slug.hpp"

namespace adrgen::text {

std::string Slugify(std::string_view title) {
  std::string slug;
  slug.reserve(title.size());

  for (char c : title) {
    if (c == ' ' || c == '_') {
      slug.push_back('-');
    } else if (c >= 'A' && c <= 'Z') {
      slug.push_back(static_cast<char>(c - 'A' + 'a'));
    } else {
      slug.push_back(c);
    }
  }
  return slug;
}

} // namespace adrgen::text
