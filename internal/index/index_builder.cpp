#include "internal/index/index_builder.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/record_naming.hpp"

namespace adrgen::index {

IndexBuilder::IndexBuilder(adrgen::store::RecordStorePtr store, std::string heading)
    : store_(std::move(store)), heading_(std::move(heading)) {
}

std::string IndexBuilder::Render(std::vector<std::string> filenames) const {
  std::sort(filenames.begin(), filenames.end());

  std::string out = "# " + heading_ + "\n\n";
  for (const auto& filename : filenames) {
    out += "- [" + adrgen::store::ExtractDisplayTitle(filename) + "](" + filename + ")\n";
  }
  return out;
}

std::size_t IndexBuilder::Rebuild() {
  auto files = store_->ListRecordFiles();
  const auto count = files.size();

  store_->WriteIndex(Render(std::move(files)));

  ADRGEN_LOG_DEBUG("index rebuilt", {adrgen::observability::IntField("entries", static_cast<std::int64_t>(count))});
  return count;
}

} // namespace adrgen::index
