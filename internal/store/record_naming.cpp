#include "internal/store/record_naming.hpp"

#include <algorithm>

#include "internal/text/slug.hpp"
#include "internal/util/errors.hpp"

namespace adrgen::store {
namespace {

// Keeps std::uint64_t arithmetic clear of overflow.
constexpr std::size_t kMaxDigits = 18;

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool AllDigits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), IsDigit);
}

std::uint64_t ToNumber(std::string_view digits) {
  std::uint64_t value = 0;
  for (char c : digits) {
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return value;
}

// ------------------------------------------------------------
// UTF-8 case mapping
//
// Covers ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic. Other
// code points have no case here and pass through.
// ------------------------------------------------------------

// Latin Extended-A blocks where the upper case letter sits on the even code point.
bool EvenUpperPair(char32_t c) {
  return (c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177);
}

bool OddUpperPair(char32_t c) {
  return (c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E);
}

char32_t ToUpper(char32_t c) {
  if (c >= U'a' && c <= U'z') return c - 0x20;
  if (c >= 0xE0 && c <= 0xFE && c != 0xF7) return c - 0x20;
  if (c == 0xFF) return 0x178;
  if (EvenUpperPair(c)) return c & ~char32_t{1};
  if (OddUpperPair(c)) return (c % 2 == 1) ? c : c - 1;
  if (c == 0x3C2) return 0x3A3;
  if (c >= 0x3B1 && c <= 0x3C9) return c - 0x20;
  if (c >= 0x430 && c <= 0x44F) return c - 0x20;
  if (c >= 0x450 && c <= 0x45F) return c - 0x50;
  return c;
}

char32_t ToLower(char32_t c) {
  if (c >= U'A' && c <= U'Z') return c + 0x20;
  if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 0x20;
  if (c == 0x178) return 0xFF;
  if (EvenUpperPair(c)) return c | char32_t{1};
  if (OddUpperPair(c)) return (c % 2 == 1) ? c + 1 : c;
  if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) return c + 0x20;
  if (c >= 0x410 && c <= 0x42F) return c + 0x20;
  if (c >= 0x400 && c <= 0x40F) return c + 0x50;
  return c;
}

// Decodes the sequence at *pos and advances past it. Malformed input
// advances one byte and yields nullopt.
std::optional<char32_t> DecodeUtf8(std::string_view s, std::size_t* pos) {
  const auto lead = static_cast<unsigned char>(s[*pos]);

  std::size_t length = 0;
  char32_t    c      = 0;
  if (lead < 0x80) {
    ++*pos;
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    c      = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    c      = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    c      = lead & 0x07;
  } else {
    ++*pos;
    return std::nullopt;
  }

  if (*pos + length > s.size()) {
    ++*pos;
    return std::nullopt;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(s[*pos + i]);
    if ((next & 0xC0) != 0x80) {
      ++*pos;
      return std::nullopt;
    }
    c = (c << 6) | (next & 0x3F);
  }
  *pos += length;
  return c;
}

void AppendUtf8(std::string* out, char32_t c) {
  if (c < 0x80) {
    out->push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (c >> 6)));
    out->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (c >> 12)));
    out->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (c >> 18)));
    out->push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

} // namespace

std::string RecordPrefix(std::string_view number) {
  std::string prefix(kRecordPrefix);
  prefix.append(number);
  prefix.push_back('-');
  return prefix;
}

std::string RecordFilename(std::string_view number, std::string_view title) {
  return RecordPrefix(number) + adrgen::text::Slugify(title) + std::string(kRecordExtension);
}

std::optional<std::uint64_t> ParseSequenceNumber(std::string_view filename) {
  if (filename.substr(0, kRecordPrefix.size()) != kRecordPrefix) {
    return std::nullopt;
  }

  auto rest = filename.substr(kRecordPrefix.size());
  auto end  = rest.find('-');
  if (end == std::string_view::npos) {
    end = rest.find(kRecordExtension);
  }
  if (end == std::string_view::npos) {
    return std::nullopt;
  }

  const auto digits = rest.substr(0, end);
  if (!AllDigits(digits) || digits.size() > kMaxDigits) {
    return std::nullopt;
  }
  return ToNumber(digits);
}

std::string FormatSequenceNumber(std::uint64_t value, std::size_t width) {
  auto digits = std::to_string(value);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return digits;
}

std::string NormalizeSequenceNumber(std::string_view input, std::size_t width) {
  if (!AllDigits(input)) {
    throw adrgen::util::InvalidArgument("record number must be digits only, got '" + std::string(input) + "'");
  }
  if (input.size() > kMaxDigits) {
    throw adrgen::util::InvalidArgument("record number is too long: '" + std::string(input) + "'");
  }
  if (ToNumber(input) == 0) {
    throw adrgen::util::InvalidArgument("record number must be positive");
  }

  std::string number(input);
  if (number.size() < width) {
    number.insert(0, width - number.size(), '0');
  }
  return number;
}

std::string ExtractDisplayTitle(std::string_view filename) {
  auto name = filename;
  if (name.size() >= kRecordExtension.size() &&
      name.substr(name.size() - kRecordExtension.size()) == kRecordExtension) {
    name.remove_suffix(kRecordExtension.size());
  }

  const auto hyphen = name.find('-');
  if (hyphen == std::string_view::npos) {
    return std::string(filename);
  }

  std::string title;
  title.reserve(name.size() - hyphen);

  const auto words      = name.substr(hyphen + 1);
  bool       word_start = true;
  for (std::size_t pos = 0; pos < words.size();) {
    const auto start = pos;
    const auto c     = DecodeUtf8(words, &pos);
    if (!c) {
      title.push_back(words[start]);
      word_start = false;
      continue;
    }
    if (*c == U'-' || *c == U' ') {
      title.push_back(' ');
      word_start = true;
      continue;
    }
    AppendUtf8(&title, word_start ? ToUpper(*c) : ToLower(*c));
    word_start = false;
  }

  // "adr" is an acronym, not a word.
  std::size_t pos = 0;
  while ((pos = title.find("Adr", pos)) != std::string::npos) {
    const bool starts = pos == 0 || title[pos - 1] == ' ';
    const bool ends   = pos + 3 == title.size() || title[pos + 3] == ' ';
    if (starts && ends) {
      title.replace(pos, 3, "ADR");
    }
    pos += 3;
  }

  return title;
}

} // namespace adrgen::store
