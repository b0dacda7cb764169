#pragma once

#include <string>
#include <vector>

#include "internal/store/record_store.hpp"

namespace adrgen::index {

/*
  Regenerates the index file from the current record set.

  The index is a pure function of the record filenames; it is always
  rewritten in full, never patched.
*/
class IndexBuilder {
 public:
  IndexBuilder(adrgen::store::RecordStorePtr store, std::string heading);

  // Index text for the given record filenames (sorted here, any input order).
  std::string Render(std::vector<std::string> filenames) const;

  // Lists the store and rewrites the index. Returns the number of entries.
  // Throws StoreUnavailable or IndexWriteFailed.
  std::size_t Rebuild();

 private:
  adrgen::store::RecordStorePtr store_;
  std::string                   heading_;
};

} // namespace adrgen::index
