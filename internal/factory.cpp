#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/store/directory_record_store.hpp"

namespace adrgen::factory {

adrgen::store::StoreLayout LayoutFromConfig(const adrgen::runtime::config::RuntimeConfig& config) {
  adrgen::store::StoreLayout layout;
  layout.directory      = config.store().directory();
  layout.index_file     = config.store().index_file();
  layout.template_file  = config.store().template_file();
  layout.sequence_width = config.store().sequence_width();
  return layout;
}

Application Build(const adrgen::runtime::config::RuntimeConfig& config, adrgen::util::ClockFn clock) {
  Application app;
  app.store      = std::make_shared<adrgen::store::DirectoryRecordStore>(LayoutFromConfig(config));
  app.index      = std::make_shared<adrgen::index::IndexBuilder>(app.store, config.store().index_heading());
  app.controller = std::make_shared<adrgen::core::LifecycleController>(app.store, app.index, std::move(clock));

  ADRGEN_LOG_DEBUG("record store ready", {adrgen::observability::StringField("directory", config.store().directory())});
  return app;
}

} // namespace adrgen::factory
