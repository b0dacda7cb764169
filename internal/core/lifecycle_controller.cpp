#include "internal/core/lifecycle_controller.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/record/record_document.hpp"
#include "internal/record/status_merger.hpp"
#include "internal/store/record_naming.hpp"
#include "internal/text/template_renderer.hpp"
#include "internal/util/errors.hpp"

namespace adrgen::core {

using adrgen::model::LifecycleStage;
using adrgen::model::StageName;
using adrgen::observability::BoolField;
using adrgen::observability::StringField;

LifecycleController::LifecycleController(adrgen::store::RecordStorePtr store, std::shared_ptr<adrgen::index::IndexBuilder> index,
                                         adrgen::util::ClockFn clock)
    : store_(std::move(store)), index_(std::move(index)), clock_(std::move(clock)) {
}

void LifecycleController::Enter(LifecycleStage next) {
  if (!adrgen::model::CanTransition(stage_, next)) {
    throw std::logic_error("invalid lifecycle transition " + std::string(StageName(stage_)) + " -> " + std::string(StageName(next)));
  }
  stage_ = next;
}

RecordOutcome LifecycleController::Apply(const RecordRequest& request) {
  stage_        = LifecycleStage::kStart;
  failed_stage_ = LifecycleStage::kStart;

  RecordOutcome outcome;
  outcome.number = request.number;

  try {
    Enter(LifecycleStage::kClassify);
    const auto existing = store_->FindByNumber(request.number);

    std::string content;
    if (!existing) {
      Enter(LifecycleStage::kCreateNew);
      CreateNew(request, &outcome, &content);
    } else {
      Enter(LifecycleStage::kUpdateExisting);
      UpdateExisting(request, *existing, &outcome, &content);
    }

    Enter(LifecycleStage::kPersist);
    Persist(content, &outcome);

    Enter(LifecycleStage::kReindexAll);
    ReindexAll(&outcome);

    Enter(LifecycleStage::kDone);
  } catch (const std::exception& e) {
    failed_stage_ = stage_;
    stage_        = LifecycleStage::kAborted;
    ADRGEN_LOG_ERROR("record lifecycle aborted", {StringField("stage", StageName(failed_stage_)), StringField("number", request.number),
                                                  StringField("error", e.what())});
    throw;
  }

  ADRGEN_LOG_INFO(outcome.action == RecordAction::kCreated ? "record created" : "record updated",
                  {StringField("number", outcome.number), StringField("file", outcome.filename), BoolField("renamed", outcome.renamed)});
  return outcome;
}

void LifecycleController::CreateNew(const RecordRequest& request, RecordOutcome* outcome, std::string* content) {
  const auto title = request.title ? adrgen::record::Trim(*request.title) : std::string();
  if (title.empty()) {
    throw adrgen::util::MissingTitle("a title is required to create record " + request.number);
  }

  const auto tmpl = store_->LoadTemplate();

  adrgen::text::TemplateValues values;
  values.number = request.number;
  values.status = adrgen::record::Trim(request.status);
  values.title  = title;
  values.date   = adrgen::util::FormatDate(clock_());

  *content = adrgen::text::Render(tmpl ? *tmpl : adrgen::text::DefaultTemplate(), values);

  outcome->action   = RecordAction::kCreated;
  outcome->title    = title;
  outcome->filename = adrgen::store::RecordFilename(request.number, title);
}

void LifecycleController::UpdateExisting(const RecordRequest& request, const std::string& existing, RecordOutcome* outcome,
                                         std::string* content) {
  const auto body = store_->ReadRecord(existing);
  auto       doc  = adrgen::record::ParseRecord(body);

  bool changed = adrgen::record::MergeStatus(&doc, request.status);

  outcome->action   = RecordAction::kUpdated;
  outcome->title    = doc.title;
  outcome->filename = existing;

  const auto new_title = request.title ? adrgen::record::Trim(*request.title) : std::string();
  if (!new_title.empty() && new_title != doc.title) {
    adrgen::record::SetTitle(&doc, new_title);
    changed = true;

    outcome->title    = new_title;
    outcome->filename = adrgen::store::RecordFilename(request.number, new_title);
    if (outcome->filename != existing) {
      outcome->renamed           = true;
      outcome->previous_filename = existing;
    }
  }

  outcome->content_changed = changed;
  *content                 = changed ? adrgen::record::SerializeRecord(doc) : body;
}

void LifecycleController::Persist(const std::string& content, RecordOutcome* outcome) {
  store_->EnsureReady();
  store_->WriteRecord(outcome->filename, content);
  outcome->path = store_->Describe(outcome->filename);

  if (!outcome->renamed) {
    return;
  }

  // The new file is already written; a leftover old file must not fail the run.
  try {
    store_->RemoveRecord(outcome->previous_filename);
    outcome->cleanup = CleanupResult::kRemoved;
  } catch (const adrgen::util::RecordWriteFailed& e) {
    outcome->cleanup       = CleanupResult::kFailed;
    outcome->cleanup_error = e.what();
    ADRGEN_LOG_WARN("old record file left behind after rename",
                    {StringField("file", outcome->previous_filename), StringField("error", e.what())});
  }
}

void LifecycleController::ReindexAll(RecordOutcome* outcome) {
  try {
    index_->Rebuild();
  } catch (const adrgen::util::IndexWriteFailed& e) {
    outcome->index_error = e.what();
  } catch (const adrgen::util::StoreUnavailable& e) {
    outcome->index_error = e.what();
  }

  if (outcome->index_error) {
    ADRGEN_LOG_ERROR("index rebuild failed, record kept", {StringField("file", outcome->filename), StringField("error", *outcome->index_error)});
  }
}

std::optional<RecordSummary> LifecycleController::Lookup(const std::string& number) const {
  const auto existing = store_->FindByNumber(number);
  if (!existing) {
    return std::nullopt;
  }

  const auto doc = adrgen::record::ParseRecord(store_->ReadRecord(*existing));

  RecordSummary summary;
  summary.number          = number;
  summary.filename        = *existing;
  summary.title           = doc.title;
  summary.status          = doc.status;
  summary.previous_status = doc.previous_status;
  return summary;
}

std::string LifecycleController::NextNumber() const {
  return store_->NextSequenceNumber();
}

std::string LifecycleController::NormalizeNumber(const std::string& input) const {
  return store_->NormalizeNumber(input);
}

std::size_t LifecycleController::Reindex() {
  store_->EnsureReady();
  return index_->Rebuild();
}

} // namespace adrgen::core
