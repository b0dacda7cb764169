#include <array>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "internal/config/config_loader.hpp"
#include "internal/core/lifecycle_controller.hpp"
#include "internal/factory.hpp"
#include "internal/model/lifecycle_stage.hpp"
#include "internal/observability/logging.hpp"
#include "internal/record/record_document.hpp"
#include "internal/util/errors.hpp"

#ifndef ADRGEN_VERSION
#define ADRGEN_VERSION "0.0.0"
#endif

using adrgen::core::CleanupResult;
using adrgen::core::RecordAction;
using adrgen::core::RecordOutcome;
using adrgen::core::RecordRequest;

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitUsage       = 1;
constexpr int kExitFatal       = 2;
constexpr int kExitIndexFailed = 3;

constexpr const char* kLocalConfig = ".adrgen.yaml";

constexpr std::array<std::string_view, 5> kStatusMenu = {"Proposed", "Accepted", "Rejected", "Deprecated", "Superseded"};

struct Options {
  std::optional<std::string> number;
  std::optional<std::string> status;
  std::optional<std::string> title;
  std::optional<std::string> dir;
  std::optional<std::string> config_path;
  bool                       interactive = false;
  bool                       reindex     = false;
  bool                       next        = false;
  bool                       help        = false;
  bool                       version     = false;
};

void Usage(std::ostream& out) {
  out << "Usage:\n"
      << "  adrgen --status <status> [--number <n>] [--title \"<title>\"]\n"
      << "  adrgen --interactive\n"
      << "  adrgen --next\n"
      << "  adrgen --reindex\n"
      << "\n"
      << "Options:\n"
      << "  --number <n>        record number (e.g. 001); next free number when omitted\n"
      << "  --status <s>        decision status (Proposed, Accepted, Rejected, Deprecated, Superseded, ...)\n"
      << "  --title <t>         record title; required for new records, renames existing ones\n"
      << "  --dir <path>        record directory (default docs/adr)\n"
      << "  --config <file>     YAML configuration (default ./" << kLocalConfig << " when present)\n"
      << "  -i, --interactive   prompt for number, status and title\n"
      << "  --next              print the next free record number\n"
      << "  --reindex           only regenerate the index\n"
      << "  -h, --help          show this help\n"
      << "  -v, --version       show the version\n";
}

// Accepts "--flag value" and "--flag=value".
bool TakeValue(int argc, char** argv, int* i, std::string_view flag, std::optional<std::string>* out) {
  const std::string_view arg = argv[*i];
  if (arg == flag) {
    if (*i + 1 >= argc) {
      throw adrgen::util::InvalidArgument("missing value for " + std::string(flag));
    }
    *out = argv[++*i];
    return true;
  }
  if (arg.size() > flag.size() && arg.substr(0, flag.size()) == flag && arg[flag.size()] == '=') {
    *out = std::string(arg.substr(flag.size() + 1));
    return true;
  }
  return false;
}

Options ParseArgs(int argc, char** argv) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];

    if (TakeValue(argc, argv, &i, "--number", &opts.number) || TakeValue(argc, argv, &i, "--status", &opts.status) ||
        TakeValue(argc, argv, &i, "--title", &opts.title) || TakeValue(argc, argv, &i, "--dir", &opts.dir) ||
        TakeValue(argc, argv, &i, "--config", &opts.config_path)) {
      continue;
    }

    if (arg == "-i" || arg == "--interactive") {
      opts.interactive = true;
    } else if (arg == "--reindex") {
      opts.reindex = true;
    } else if (arg == "--next") {
      opts.next = true;
    } else if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "-v" || arg == "--version") {
      opts.version = true;
    } else {
      throw adrgen::util::InvalidArgument("unknown argument: " + std::string(arg));
    }
  }
  return opts;
}

adrgen::runtime::config::RuntimeConfig LoadConfig(const Options& opts) {
  adrgen::runtime::config::RuntimeConfig config;
  if (opts.config_path) {
    config = adrgen::config::ConfigLoader::LoadFromYaml(*opts.config_path);
  } else if (std::filesystem::exists(kLocalConfig)) {
    config = adrgen::config::ConfigLoader::LoadFromYaml(kLocalConfig);
  } else {
    config = adrgen::config::ConfigLoader::Defaults();
  }

  adrgen::config::ConfigLoader::ApplyEnvironment(&config);
  if (opts.dir) {
    config.mutable_store()->set_directory(*opts.dir);
  }
  return config;
}

std::string Prompt(const std::string& label, const std::string& fallback) {
  std::cout << label;
  if (!fallback.empty()) {
    std::cout << " [" << fallback << "]";
  }
  std::cout << ": " << std::flush;

  std::string line;
  if (!std::getline(std::cin, line)) {
    throw adrgen::util::InvalidArgument("input closed while prompting for " + label);
  }
  line = adrgen::record::Trim(line);
  return line.empty() ? fallback : line;
}

std::string PromptStatus(const std::string& fallback) {
  std::cout << "Status:\n";
  for (std::size_t i = 0; i < kStatusMenu.size(); ++i) {
    std::cout << "  " << (i + 1) << ") " << kStatusMenu[i] << "\n";
  }

  for (;;) {
    const auto answer = Prompt("Choose 1-" + std::to_string(kStatusMenu.size()) + " or type a status", fallback);
    if (answer.size() == 1 && answer[0] >= '1' && answer[0] < static_cast<char>('1' + kStatusMenu.size())) {
      return std::string(kStatusMenu[static_cast<std::size_t>(answer[0] - '1')]);
    }
    if (!answer.empty()) {
      return answer;
    }
    std::cout << "A status is required.\n";
  }
}

RecordRequest InteractiveRequest(const adrgen::core::LifecycleController& controller) {
  RecordRequest request;
  request.number = controller.NormalizeNumber(Prompt("Record number", controller.NextNumber()));

  const auto existing = controller.Lookup(request.number);
  if (existing) {
    std::cout << "Updating " << existing->filename << " (status: " << (existing->status.empty() ? "none" : existing->status) << ")\n";
    request.status = PromptStatus(existing->status);
    request.title  = Prompt("Title", existing->title);
    return request;
  }

  request.status = PromptStatus(std::string(kStatusMenu[0]));
  for (;;) {
    auto title = Prompt("Title", "");
    if (!title.empty()) {
      request.title = std::move(title);
      return request;
    }
    std::cout << "A title is required for a new record.\n";
  }
}

RecordRequest FlagRequest(const Options& opts, const adrgen::core::LifecycleController& controller) {
  RecordRequest request;
  request.number = opts.number ? controller.NormalizeNumber(*opts.number) : controller.NextNumber();
  request.status = *opts.status;
  request.title  = opts.title;
  return request;
}

int Report(const RecordOutcome& outcome) {
  if (outcome.action == RecordAction::kCreated) {
    std::cout << "New ADR created: " << outcome.path << "\n";
  } else if (outcome.renamed) {
    std::cout << "ADR updated and renamed: " << outcome.previous_filename << " -> " << outcome.path << "\n";
  } else if (!outcome.content_changed) {
    std::cout << "ADR already up to date: " << outcome.path << "\n";
  } else {
    std::cout << "ADR updated: " << outcome.path << "\n";
  }

  if (outcome.cleanup == CleanupResult::kFailed) {
    std::cerr << "warning: old file " << outcome.previous_filename << " could not be removed: " << outcome.cleanup_error << "\n";
  }

  if (outcome.index_error) {
    std::cerr << "error: record saved but the index was not updated: " << *outcome.index_error << "\n";
    return kExitIndexFailed;
  }
  return kExitOk;
}

int Run(const Options& opts) {
  auto config = LoadConfig(opts);
  adrgen::observability::InitializeLogging(config);

  auto app = adrgen::factory::Build(config);

  if (opts.next) {
    std::cout << app.controller->NextNumber() << "\n";
    return kExitOk;
  }

  if (opts.reindex) {
    try {
      const auto entries = app.controller->Reindex();
      std::cout << "Index rebuilt with " << entries << " record(s): " << app.store->Describe(config.store().index_file()) << "\n";
      return kExitOk;
    } catch (const adrgen::util::IndexWriteFailed& e) {
      std::cerr << "error: " << e.what() << "\n";
      return kExitIndexFailed;
    }
  }

  if (!opts.interactive && (!opts.status || adrgen::record::Trim(*opts.status).empty())) {
    std::cerr << "error: --status is required (or use --interactive)\n\n";
    Usage(std::cerr);
    return kExitUsage;
  }

  const auto request = opts.interactive ? InteractiveRequest(*app.controller) : FlagRequest(opts, *app.controller);

  try {
    return Report(app.controller->Apply(request));
  } catch (const std::exception& e) {
    std::cerr << "error: " << adrgen::model::StageName(app.controller->failed_stage()) << " step failed: " << e.what() << "\n";
    return kExitFatal;
  }
}

} // namespace

int main(int argc, char** argv) {
  Options opts;
  try {
    opts = ParseArgs(argc, argv);
  } catch (const adrgen::util::InvalidArgument& e) {
    std::cerr << "error: " << e.what() << "\n\n";
    Usage(std::cerr);
    return kExitUsage;
  }

  if (opts.help) {
    Usage(std::cout);
    return kExitOk;
  }
  if (opts.version) {
    std::cout << "adrgen " << ADRGEN_VERSION << "\n";
    return kExitOk;
  }

  int code = kExitOk;
  try {
    code = Run(opts);
  } catch (const adrgen::util::InvalidArgument& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = kExitFatal;
  }

  adrgen::observability::ShutdownLogging();
  return code;
}
