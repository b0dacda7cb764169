#include "internal/store/directory_record_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using adrgen::store::DirectoryRecordStore;
using adrgen::store::StoreLayout;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "adrgen_record_store_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void Touch(const fs::path& path, const std::string& content = "content") {
  std::ofstream out(path);
  out << content;
}

StoreLayout LayoutFor(const fs::path& dir) {
  StoreLayout layout;
  layout.directory = dir;
  return layout;
}

void TestListSkipsReservedFilesAndDirectories() {
  const auto dir = FreshDir("list");
  Touch(dir / "adr-002-b.md");
  Touch(dir / "adr-001-a.md");
  Touch(dir / "README.md");
  Touch(dir / "template.md");
  Touch(dir / "notes.txt");
  Touch(dir / "other.md");
  fs::create_directories(dir / "adr-003-folder.md");

  DirectoryRecordStore store(LayoutFor(dir));
  const auto           files = store.ListRecordFiles();

  const std::vector<std::string> expected = {"adr-001-a.md", "adr-002-b.md", "other.md"};
  assert(files == expected);
}

void TestListFailsWhenDirectoryMissing() {
  const auto dir = FreshDir("missing") / "nope";

  DirectoryRecordStore store(LayoutFor(dir));
  assert(!store.Available());

  bool threw = false;
  try {
    store.ListRecordFiles();
  } catch (const adrgen::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestExistsMatchesNumberPrefixOnly() {
  const auto dir = FreshDir("exists");
  Touch(dir / "adr-001-first.md");
  Touch(dir / "adr-0011-wide.md");

  DirectoryRecordStore store(LayoutFor(dir));
  assert(store.Exists("001"));
  assert(store.Exists("0011"));
  assert(!store.Exists("01"));
  assert(!store.Exists("002"));
  assert(store.FindByNumber("001") == std::string("adr-001-first.md"));
  assert(!store.FindByNumber("002"));
}

void TestExistsIsFalseForAbsentDirectory() {
  DirectoryRecordStore store(LayoutFor(FreshDir("absent") / "docs" / "adr"));
  assert(!store.Exists("001"));
  assert(!store.FindByNumber("001"));
}

void TestNextSequenceNumberSkipsGapsAndMalformedNames() {
  const auto dir = FreshDir("next");
  Touch(dir / "adr-001-a.md");
  Touch(dir / "adr-003-b.md");
  Touch(dir / "adr-xyz-broken.md");
  Touch(dir / "adr-.md");

  DirectoryRecordStore store(LayoutFor(dir));
  assert(store.NextSequenceNumber() == "004");
}

void TestNextSequenceNumberOnEmptyAndAbsentStore() {
  DirectoryRecordStore empty(LayoutFor(FreshDir("next_empty")));
  assert(empty.NextSequenceNumber() == "001");

  DirectoryRecordStore absent(LayoutFor(FreshDir("next_absent") / "missing"));
  assert(absent.NextSequenceNumber() == "001");
}

void TestNextSequenceNumberKeepsWidestConvention() {
  const auto dir = FreshDir("next_wide");
  Touch(dir / "adr-0009-a.md");
  Touch(dir / "adr-002-b.md");

  DirectoryRecordStore store(LayoutFor(dir));
  assert(store.NextSequenceNumber() == "0010");

  Touch(dir / "adr-999-c.md");
  assert(store.NextSequenceNumber() == "1000");
}

void TestNormalizeNumberUsesStoreWidth() {
  const auto dir = FreshDir("normalize_width");
  DirectoryRecordStore store(LayoutFor(dir));
  assert(store.SequenceWidth() == 3);
  assert(store.NormalizeNumber("1") == "001");

  Touch(dir / "adr-0001-wide.md");
  assert(store.SequenceWidth() == 4);
  assert(store.NormalizeNumber("1") == "0001");
  assert(store.NormalizeNumber("001") == "0001");
  assert(store.FindByNumber(store.NormalizeNumber("1")) == std::string("adr-0001-wide.md"));

  bool threw = false;
  try {
    store.NormalizeNumber("0");
  } catch (const adrgen::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNormalizeNumberRejectsInputBeforeListing() {
  DirectoryRecordStore absent(LayoutFor(FreshDir("normalize_absent") / "missing"));
  assert(absent.NormalizeNumber("42") == "042");

  bool threw = false;
  try {
    absent.NormalizeNumber("4a");
  } catch (const adrgen::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestReadWriteRemove() {
  const auto dir = FreshDir("io");

  DirectoryRecordStore store(LayoutFor(dir));
  store.WriteRecord("adr-001-a.md", "hello\n");
  assert(store.ReadRecord("adr-001-a.md") == "hello\n");

  store.RemoveRecord("adr-001-a.md");
  assert(!fs::exists(dir / "adr-001-a.md"));

  bool remove_threw = false;
  try {
    store.RemoveRecord("adr-001-a.md");
  } catch (const adrgen::util::RecordWriteFailed&) {
    remove_threw = true;
  }
  assert(remove_threw);

  bool read_threw = false;
  try {
    store.ReadRecord("adr-404-missing.md");
  } catch (const adrgen::util::RecordUnreadable&) {
    read_threw = true;
  }
  assert(read_threw);
}

void TestWriteIntoMissingDirectoryFails() {
  DirectoryRecordStore store(LayoutFor(FreshDir("write_missing") / "missing"));

  bool threw = false;
  try {
    store.WriteRecord("adr-001-a.md", "x");
  } catch (const adrgen::util::RecordWriteFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestEnsureReadyCreatesNestedDirectory() {
  const auto dir = FreshDir("ensure") / "docs" / "adr";

  DirectoryRecordStore store(LayoutFor(dir));
  store.EnsureReady();
  assert(fs::is_directory(dir));
  assert(store.Available());
  assert(store.ListRecordFiles().empty());
}

void TestEnsureReadyFailsWhenPathIsAFile() {
  const auto base = FreshDir("ensure_file");
  Touch(base / "blocker");

  DirectoryRecordStore store(LayoutFor(base / "blocker"));
  bool                 threw = false;
  try {
    store.EnsureReady();
  } catch (const adrgen::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestTemplateOverride() {
  const auto dir = FreshDir("template");

  DirectoryRecordStore store(LayoutFor(dir));
  assert(!store.LoadTemplate());

  Touch(dir / "template.md", "Custom {{number}} {{title}}");
  const auto tmpl = store.LoadTemplate();
  assert(tmpl.has_value());
  assert(*tmpl == "Custom {{number}} {{title}}");
}

void TestCustomReservedNames() {
  const auto dir = FreshDir("custom_layout");
  Touch(dir / "INDEX.md");
  Touch(dir / "tmpl.md", "T");
  Touch(dir / "README.md");

  StoreLayout layout    = LayoutFor(dir);
  layout.index_file    = "INDEX.md";
  layout.template_file = "tmpl.md";

  DirectoryRecordStore store(layout);
  const std::vector<std::string> expected = {"README.md"};
  assert(store.ListRecordFiles() == expected);
  assert(store.LoadTemplate() == std::string("T"));

  store.WriteIndex("# Index\n");
  std::ifstream in(dir / "INDEX.md");
  std::string   first;
  std::getline(in, first);
  assert(first == "# Index");
}

} // namespace

int main() {
  TestListSkipsReservedFilesAndDirectories();
  TestListFailsWhenDirectoryMissing();
  TestExistsMatchesNumberPrefixOnly();
  TestExistsIsFalseForAbsentDirectory();
  TestNextSequenceNumberSkipsGapsAndMalformedNames();
  TestNextSequenceNumberOnEmptyAndAbsentStore();
  TestNextSequenceNumberKeepsWidestConvention();
  TestNormalizeNumberUsesStoreWidth();
  TestNormalizeNumberRejectsInputBeforeListing();
  TestReadWriteRemove();
  TestWriteIntoMissingDirectoryFails();
  TestEnsureReadyCreatesNestedDirectory();
  TestEnsureReadyFailsWhenPathIsAFile();
  TestTemplateOverride();
  TestCustomReservedNames();

  std::cout << "adrgen_unit_record_store: pass\n";
  return 0;
}
