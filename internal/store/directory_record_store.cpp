#include "internal/store/directory_record_store.hpp"

#include <algorithm>
#include <fstream>
#include <utility>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/store/record_naming.hpp"
#include "internal/util/errors.hpp"

namespace adrgen::store {

namespace fs = std::filesystem;

using adrgen::observability::StringField;
using adrgen::util::IndexWriteFailed;
using adrgen::util::RecordUnreadable;
using adrgen::util::RecordWriteFailed;
using adrgen::util::StoreUnavailable;

namespace {

bool HasExtension(const std::string& name, std::string_view ext) {
  return name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

bool ReadWholeFile(const fs::path& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  *out = buffer.str();
  return true;
}

bool WriteWholeFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  return !out.fail();
}

} // namespace

DirectoryRecordStore::DirectoryRecordStore(StoreLayout layout) : RecordStore(std::move(layout)) {
}

fs::path DirectoryRecordStore::PathOf(const std::string& filename) const {
  return layout().directory / filename;
}

std::string DirectoryRecordStore::Describe(const std::string& filename) const {
  return PathOf(filename).string();
}

bool DirectoryRecordStore::Available() const {
  std::error_code ec;
  return fs::is_directory(layout().directory, ec);
}

void DirectoryRecordStore::EnsureReady() {
  std::error_code ec;
  fs::create_directories(layout().directory, ec);
  if (ec) {
    throw StoreUnavailable("cannot create record directory " + layout().directory.string() + ": " + ec.message());
  }
  if (!fs::is_directory(layout().directory, ec)) {
    throw StoreUnavailable("record directory " + layout().directory.string() + " is not a directory");
  }
}

std::vector<std::string> DirectoryRecordStore::ListRecordFiles() const {
  std::error_code ec;
  fs::directory_iterator it(layout().directory, ec);
  if (ec) {
    throw StoreUnavailable("cannot read record directory " + layout().directory.string() + ": " + ec.message());
  }

  std::vector<std::string> files;
  const fs::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      continue;
    }

    auto name = it->path().filename().string();
    if (!HasExtension(name, kRecordExtension) || IsReservedName(name)) {
      continue;
    }
    files.push_back(std::move(name));
  }
  if (ec) {
    throw StoreUnavailable("cannot read record directory " + layout().directory.string() + ": " + ec.message());
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::string DirectoryRecordStore::ReadRecord(const std::string& filename) const {
  std::string content;
  if (!ReadWholeFile(PathOf(filename), &content)) {
    throw RecordUnreadable("cannot read record " + Describe(filename));
  }
  return content;
}

void DirectoryRecordStore::WriteRecord(const std::string& filename, const std::string& content) {
  if (!WriteWholeFile(PathOf(filename), content)) {
    throw RecordWriteFailed("cannot write record " + Describe(filename));
  }
}

void DirectoryRecordStore::RemoveRecord(const std::string& filename) {
  std::error_code ec;
  if (!fs::remove(PathOf(filename), ec) || ec) {
    throw RecordWriteFailed("cannot remove record " + Describe(filename) + (ec ? ": " + ec.message() : ": no such file"));
  }
}

std::optional<std::string> DirectoryRecordStore::LoadTemplate() const {
  const auto      path = PathOf(layout().template_file);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }

  std::string content;
  if (!ReadWholeFile(path, &content)) {
    ADRGEN_LOG_WARN("template override unreadable, using built-in template", {StringField("path", path.string())});
    return std::nullopt;
  }
  return content;
}

void DirectoryRecordStore::WriteIndex(const std::string& content) {
  if (!WriteWholeFile(PathOf(layout().index_file), content)) {
    throw IndexWriteFailed("cannot write index " + Describe(layout().index_file));
  }
}

} // namespace adrgen::store
