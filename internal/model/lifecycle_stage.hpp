#pragma once

#include <cstdint>
#include <string_view>

namespace adrgen::model {

// Steps of one create-or-update invocation. Nothing persists between runs.
enum class LifecycleStage : std::uint8_t {
  kStart          = 0,
  kClassify       = 1,
  kCreateNew      = 2,
  kUpdateExisting = 3,
  kPersist        = 4,
  kReindexAll     = 5,
  kDone           = 6,
  kAborted        = 7,
};

constexpr bool IsTerminal(LifecycleStage stage) {
  return stage == LifecycleStage::kDone || stage == LifecycleStage::kAborted;
}

constexpr bool CanTransition(LifecycleStage from, LifecycleStage to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == LifecycleStage::kAborted) {
    return true;
  }

  switch (from) {
    case LifecycleStage::kStart:
      return to == LifecycleStage::kClassify;
    case LifecycleStage::kClassify:
      return to == LifecycleStage::kCreateNew || to == LifecycleStage::kUpdateExisting;
    case LifecycleStage::kCreateNew:
    case LifecycleStage::kUpdateExisting:
      return to == LifecycleStage::kPersist;
    case LifecycleStage::kPersist:
      return to == LifecycleStage::kReindexAll;
    case LifecycleStage::kReindexAll:
      return to == LifecycleStage::kDone;
    default:
      return false;
  }
}

constexpr std::string_view StageName(LifecycleStage stage) {
  switch (stage) {
    case LifecycleStage::kStart:
      return "start";
    case LifecycleStage::kClassify:
      return "classify";
    case LifecycleStage::kCreateNew:
      return "create";
    case LifecycleStage::kUpdateExisting:
      return "update";
    case LifecycleStage::kPersist:
      return "persist";
    case LifecycleStage::kReindexAll:
      return "reindex";
    case LifecycleStage::kDone:
      return "done";
    case LifecycleStage::kAborted:
      return "aborted";
  }
  return "unknown";
}

}  // namespace adrgen::model
