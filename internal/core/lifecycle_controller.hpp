#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/index/index_builder.hpp"
#include "internal/model/lifecycle_stage.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/time.hpp"

namespace adrgen::core {

struct RecordRequest {
  // Normalized sequence number ("007").
  std::string number;
  std::string status;
  // Required for new records; for existing ones a different title renames the file.
  std::optional<std::string> title;
};

enum class RecordAction { kCreated, kUpdated };

// Outcome of removing the old file after a rename.
enum class CleanupResult { kNotAttempted, kRemoved, kFailed };

struct RecordOutcome {
  RecordAction action = RecordAction::kCreated;
  std::string  number;
  std::string  title;
  std::string  filename;
  std::string  path;

  // False when an update re-applied the current status and title.
  bool content_changed = true;

  bool          renamed = false;
  std::string   previous_filename;
  CleanupResult cleanup = CleanupResult::kNotAttempted;
  std::string   cleanup_error;

  // Set when the record was saved but the index could not be rebuilt.
  std::optional<std::string> index_error;
};

// What an existing record currently says about itself.
struct RecordSummary {
  std::string                number;
  std::string                filename;
  std::string                title;
  std::string                status;
  std::optional<std::string> previous_status;
};

/*
  Create-or-update engine.

  Apply() walks Classify → CreateNew | UpdateExisting → Persist →
  ReindexAll. Failures before Persist leave the store untouched. After a
  successful Persist the record stays written: a failed old-file cleanup
  or a failed index rebuild is reported on the outcome, not thrown.
*/
class LifecycleController {
 public:
  LifecycleController(adrgen::store::RecordStorePtr store, std::shared_ptr<adrgen::index::IndexBuilder> index,
                      adrgen::util::ClockFn clock = adrgen::util::Now);

  RecordOutcome Apply(const RecordRequest& request);

  std::optional<RecordSummary> Lookup(const std::string& number) const;

  std::string NextNumber() const;

  // Operator input ("7") to the store's padded form ("007"). Throws InvalidArgument.
  std::string NormalizeNumber(const std::string& input) const;

  // Rebuilds the index on its own. Returns the number of entries.
  std::size_t Reindex();

  // Stage reached by the last Apply(); kAborted after a thrown failure.
  adrgen::model::LifecycleStage stage() const {
    return stage_;
  }

  // Stage that was running when the last Apply() aborted.
  adrgen::model::LifecycleStage failed_stage() const {
    return failed_stage_;
  }

 private:
  void Enter(adrgen::model::LifecycleStage next);

  void CreateNew(const RecordRequest& request, RecordOutcome* outcome, std::string* content);
  void UpdateExisting(const RecordRequest& request, const std::string& existing, RecordOutcome* outcome, std::string* content);
  void Persist(const std::string& content, RecordOutcome* outcome);
  void ReindexAll(RecordOutcome* outcome);

  adrgen::store::RecordStorePtr               store_;
  std::shared_ptr<adrgen::index::IndexBuilder> index_;
  adrgen::util::ClockFn                       clock_;

  adrgen::model::LifecycleStage stage_        = adrgen::model::LifecycleStage::kStart;
  adrgen::model::LifecycleStage failed_stage_ = adrgen::model::LifecycleStage::kStart;
};

} // namespace adrgen::core
