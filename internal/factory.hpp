#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/lifecycle_controller.hpp"
#include "internal/index/index_builder.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/time.hpp"

namespace adrgen::factory {

/*
  Application

  Everything one invocation needs, wired from the runtime config.
*/
struct Application {
  adrgen::store::RecordStorePtr                store;
  std::shared_ptr<adrgen::index::IndexBuilder> index;
  std::shared_ptr<adrgen::core::LifecycleController> controller;
};

adrgen::store::StoreLayout LayoutFromConfig(const adrgen::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows the concrete store type.
*/
Application Build(const adrgen::runtime::config::RuntimeConfig& config, adrgen::util::ClockFn clock = adrgen::util::Now);

} // namespace adrgen::factory
