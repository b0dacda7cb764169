#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adrgen::store {

/*
  Where the store lives and which names in it are reserved.
*/
struct StoreLayout {
  std::filesystem::path directory;
  std::string           index_file     = "README.md";
  std::string           template_file  = "template.md";
  std::size_t           sequence_width = 3;
};

/*
  Record store abstraction.

  A store is a flat set of record files plus two reserved files: the
  generated index and the optional template override. It keeps no state
  between calls; every query re-reads the backing directory.

  Implementations:
    DirectoryRecordStore → one directory on the local filesystem
*/
class RecordStore {
 public:
  explicit RecordStore(StoreLayout layout);
  virtual ~RecordStore() = default;

  const StoreLayout& layout() const {
    return layout_;
  }

  // ------------------------------------------------------------------
  // Backend primitives
  // ------------------------------------------------------------------

  // False while the backing directory does not exist yet (first run).
  virtual bool Available() const = 0;

  // Creates the backing directory if needed. Throws StoreUnavailable.
  virtual void EnsureReady() = 0;

  /*
    Record filenames, ascending. Reserved names, subdirectories and
    non-markdown entries are left out. Throws StoreUnavailable.
  */
  virtual std::vector<std::string> ListRecordFiles() const = 0;

  // Throws RecordUnreadable.
  virtual std::string ReadRecord(const std::string& filename) const = 0;

  // Throws RecordWriteFailed.
  virtual void WriteRecord(const std::string& filename, const std::string& content) = 0;

  // Throws RecordWriteFailed.
  virtual void RemoveRecord(const std::string& filename) = 0;

  // Template override content, nullopt when there is none.
  virtual std::optional<std::string> LoadTemplate() const = 0;

  // Replaces the whole index file. Throws IndexWriteFailed.
  virtual void WriteIndex(const std::string& content) = 0;

  // Human readable location of a file, for operator messages.
  virtual std::string Describe(const std::string& filename) const = 0;

  // ------------------------------------------------------------------
  // Queries built on ListRecordFiles
  // ------------------------------------------------------------------

  bool IsReservedName(std::string_view name) const;

  // True iff a record file starts with "adr-<number>-". An unreadable or
  // missing directory reads as "no such record".
  bool Exists(std::string_view number) const;

  std::optional<std::string> FindByNumber(std::string_view number) const;

  /*
    Highest parsed sequence number + 1, padded to the widest of the
    configured width and the widest number already in use. Names that do
    not parse are skipped. "001" (at width 3) for an empty or absent store.
  */
  std::string NextSequenceNumber() const;

  // Widest of the configured width and the numbers already on disk.
  std::size_t SequenceWidth() const;

  /*
    Validates operator input and pads it to SequenceWidth(), so "1" finds
    "adr-0001-*" in a store that already uses four digits.
    Throws InvalidArgument.
  */
  std::string NormalizeNumber(std::string_view input) const;

 private:
  // Highest parsed sequence number and the width to pad to. Throws StoreUnavailable.
  void ScanSequence(std::uint64_t* highest, std::size_t* width) const;

  StoreLayout layout_;
};

using RecordStorePtr = std::shared_ptr<RecordStore>;

} // namespace adrgen::store
