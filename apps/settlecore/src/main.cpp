#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include <spdlog/spdlog.h>

#include "settlecore/common/logging.hpp"
#include "settlecore/config/config_loader.hpp"
#include "settlecore/engine/engine_service.hpp"
#include "settlecore/ingest/csv_reader.hpp"
#include "settlecore/ledger/outcome.hpp"
#include "settlecore/report/csv_writer.hpp"
#include "settlecore/telemetry/telemetry_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv>\n"
            << "  Writes final account balances as CSV to stdout.\n"
            << "  Settings are read from ./settlecore.toml, $SETTLECORE_CONFIG or\n"
            << "  /etc/settlecore/settlecore.toml when present.\n";
}

std::filesystem::path find_config_path() {
  const char* env_path = std::getenv("SETTLECORE_CONFIG");
  std::filesystem::path default_paths[] = {
      "./settlecore.toml",
      std::filesystem::path{env_path ? env_path : ""},
      "/etc/settlecore/settlecore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }
  return {};
}

bool load_config(settlecore::config::AppConfig& cfg, std::filesystem::path& config_path) {
  using settlecore::config::ConfigLoader;

  config_path = find_config_path();
  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Config validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }

  cfg = std::move(result.config);
  if (const char* level = std::getenv("SETTLECORE_LOG_LEVEL")) {
    cfg.logging.level = level;
  }
  return true;
}

void log_telemetry(const settlecore::telemetry::Summary& summary) {
  using settlecore::ledger::Outcome;

  spdlog::info("applied={} rejected={} malformed_rows={}", summary.count(Outcome::kApplied), summary.rejected(),
               summary.malformed_rows);
  for (std::size_t idx = 0; idx < settlecore::ledger::kOutcomeCount; ++idx) {
    const auto outcome = static_cast<Outcome>(idx);
    if (outcome != Outcome::kApplied && summary.count(outcome) > 0) {
      spdlog::info("  rejected {}: {}", settlecore::ledger::to_string(outcome), summary.count(outcome));
    }
  }
  spdlog::info("latency: count={} mean={:.0f}ns p99={:.0f}ns", summary.latency_count, summary.latency_mean_ns,
               summary.latency_p99_ns);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace settlecore;

  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }

  config::AppConfig cfg;
  std::filesystem::path config_path;
  if (!load_config(cfg, config_path)) {
    return 1;
  }
  common::init_logging(cfg.logging.level, cfg.logging.pattern);
  if (config_path.empty()) {
    spdlog::debug("no config file found, using defaults");
  } else {
    spdlog::info("loaded config from {}", config_path.string());
  }

  try {
    const std::filesystem::path input_path{argv[1]};
    auto input = ingest::open_transactions_file(input_path);
    spdlog::info("processing {}", input_path.string());

    telemetry::TelemetrySink telemetry;
    telemetry::TelemetrySink* sink = cfg.telemetry.enabled ? &telemetry : nullptr;

    engine::EngineService service({.queue_depth = cfg.engine.queue_depth}, sink);
    service.start();

    ingest::CsvTransactionReader reader(input, [sink](const ingest::ParseError&) {
      if (sink) {
        sink->record_malformed_row();
      }
    });

    ledger::Transaction tx;
    while (reader.next(tx)) {
      if (!service.submit(tx)) {
        break;
      }
    }
    const auto snapshot = service.join();

    report::write_accounts_csv(snapshot, std::cout);

    spdlog::info("read {} rows ({} malformed), {} accounts", reader.stats().rows, reader.stats().malformed,
                 snapshot.size());
    if (sink) {
      log_telemetry(telemetry.summary());
    }
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }

  return 0;
}
