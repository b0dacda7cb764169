#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace adrgen::store {

/*
  Record filename grammar:

      adr-<NNN>-<slug>.md

  <NNN> is the zero padded sequence number and the record's identity.
  <slug> is derived from the title and changes with it.
*/

inline constexpr std::string_view kRecordPrefix    = "adr-";
inline constexpr std::string_view kRecordExtension = ".md";

// "adr-<number>-": every file of record <number> starts with this.
std::string RecordPrefix(std::string_view number);

std::string RecordFilename(std::string_view number, std::string_view title);

// Leading numeric segment after "adr-"; nullopt for names that do not follow the grammar.
std::optional<std::uint64_t> ParseSequenceNumber(std::string_view filename);

std::string FormatSequenceNumber(std::uint64_t value, std::size_t width);

// Validates operator input ("7", "007") and pads it to width. Throws InvalidArgument.
std::string NormalizeSequenceNumber(std::string_view input, std::size_t width);

/*
  Display title for the index, derived from the filename only:
  extension dropped, split at the first hyphen, hyphens to spaces,
  each word title-cased, "Adr" restored to "ADR".
*/
std::string ExtractDisplayTitle(std::string_view filename);

} // namespace adrgen::store
