#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <type_traits>

#include "pv/error.h"
#include "pv/log/event_bus.h"

namespace pv::storage {

struct RetryPolicy {
  int max_retries{4};
  std::chrono::milliseconds initial_backoff{5};
};

// Runs |fn|, retrying IoErrors marked transient with doubling backoff. Other errors and the
// last transient failure propagate unchanged.
template <class F>
auto RetryTransient(const RetryPolicy& policy, log::EventBus* bus, const std::string& operation,
                    F&& fn) -> std::invoke_result_t<F&> {
  auto backoff = policy.initial_backoff;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const IoError& error) {
      if (error.retryability != Retryability::kTransient || attempt >= policy.max_retries) {
        throw;
      }
      log::Event event;
      event.category = log::EventCategory::kStorage;
      event.severity = log::EventSeverity::kWarning;
      event.event_id = "io_retry";
      event.message = error.what();
      event.fields.emplace_back("operation", operation);
      event.fields.emplace_back("attempt", std::to_string(attempt + 1), log::FieldPrivacy::kPublic,
                                true);
      log::Publish(bus, std::move(event));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

} // namespace pv::storage
