#include "settlecore/engine/engine_service.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace settlecore {
namespace engine {

EngineService::EngineService(const Config& config, telemetry::TelemetrySink* telemetry)
    : channel_(config.queue_depth), engine_(telemetry) {}

EngineService::~EngineService() {
  channel_.close();
  if (consumer_.joinable()) {
    consumer_.join();
  }
}

void EngineService::start() {
  if (consumer_.joinable() || result_) {
    throw std::logic_error("engine service already started");
  }
  consumer_ = std::thread(&EngineService::run, this);
}

bool EngineService::submit(ledger::Transaction tx) {
  return channel_.push(std::move(tx));
}

void EngineService::close() {
  channel_.close();
}

snapshot::Snapshot EngineService::join() {
  if (!result_) {
    if (!consumer_.joinable()) {
      throw std::logic_error("engine service not started");
    }
    channel_.close();
    consumer_.join();
    if (failure_) {
      std::rethrow_exception(failure_);
    }
    result_ = engine_.snapshot();
  }
  return *result_;
}

void EngineService::run() {
  try {
    ledger::Transaction tx;
    while (channel_.pop(tx)) {
      engine_.process(tx);
    }
    spdlog::debug("engine drained: processed={} applied={} rejected={}", engine_.stats().processed,
                  engine_.stats().applied, engine_.stats().rejected);
  } catch (...) {
    // Stop producers from blocking on a consumer that is gone; join() rethrows.
    failure_ = std::current_exception();
    channel_.close();
  }
}

}  // namespace engine
}  // namespace settlecore
