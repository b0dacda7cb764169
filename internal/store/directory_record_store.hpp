#pragma once

#include <filesystem>

#include "internal/store/record_store.hpp"

namespace adrgen::store {

/*
  Record store backed by a single local directory.

  Properties:
    - non-recursive listing
    - plain overwrite writes, no temp file + rename
    - no locking; one operator, one process at a time
*/
class DirectoryRecordStore : public RecordStore {
 public:
  explicit DirectoryRecordStore(StoreLayout layout);

  bool Available() const override;
  void EnsureReady() override;

  std::vector<std::string> ListRecordFiles() const override;

  std::string ReadRecord(const std::string& filename) const override;
  void        WriteRecord(const std::string& filename, const std::string& content) override;
  void        RemoveRecord(const std::string& filename) override;

  std::optional<std::string> LoadTemplate() const override;
  void                       WriteIndex(const std::string& content) override;

  std::string Describe(const std::string& filename) const override;

 private:
  std::filesystem::path PathOf(const std::string& filename) const;
};

} // namespace adrgen::store
