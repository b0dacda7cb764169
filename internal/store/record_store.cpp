#include "internal/store/record_store.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/record_naming.hpp"
#include "internal/util/errors.hpp"

namespace adrgen::store {

RecordStore::RecordStore(StoreLayout layout) : layout_(std::move(layout)) {
}

bool RecordStore::IsReservedName(std::string_view name) const {
  return name == layout_.index_file || name == layout_.template_file;
}

bool RecordStore::Exists(std::string_view number) const {
  return FindByNumber(number).has_value();
}

std::optional<std::string> RecordStore::FindByNumber(std::string_view number) const {
  if (!Available()) {
    return std::nullopt;
  }

  std::vector<std::string> files;
  try {
    files = ListRecordFiles();
  } catch (const adrgen::util::StoreUnavailable& e) {
    ADRGEN_LOG_DEBUG("record lookup treated as not found", {adrgen::observability::StringField("error", e.what())});
    return std::nullopt;
  }

  const auto prefix = RecordPrefix(number);
  for (const auto& file : files) {
    if (file.compare(0, prefix.size(), prefix) == 0) {
      return file;
    }
  }
  return std::nullopt;
}

void RecordStore::ScanSequence(std::uint64_t* highest, std::size_t* width) const {
  *highest = 0;
  *width   = layout_.sequence_width;

  if (!Available()) {
    return;
  }

  for (const auto& file : ListRecordFiles()) {
    const auto number = ParseSequenceNumber(file);
    if (!number) {
      continue;
    }
    *highest = std::max(*highest, *number);

    const auto rest   = std::string_view(file).substr(kRecordPrefix.size());
    const auto digits = std::min(rest.find_first_not_of("0123456789"), rest.size());
    *width            = std::max(*width, digits);
  }
}

std::string RecordStore::NextSequenceNumber() const {
  std::uint64_t highest = 0;
  std::size_t   width   = 0;
  ScanSequence(&highest, &width);
  return FormatSequenceNumber(highest + 1, width);
}

std::size_t RecordStore::SequenceWidth() const {
  std::uint64_t highest = 0;
  std::size_t   width   = 0;
  ScanSequence(&highest, &width);
  return width;
}

std::string RecordStore::NormalizeNumber(std::string_view input) const {
  // Reject bad input before touching the directory.
  const auto digits = NormalizeSequenceNumber(input, 0);
  return NormalizeSequenceNumber(digits, SequenceWidth());
}

} // namespace adrgen::store
