#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace slotwatch::browser {

/*
  Ordered fallback chain.

  Each probe either yields a value, yields nothing, or throws. A throw is a
  best-effort miss: it is logged at info and the next probe runs.
*/
template <typename T>
struct Probe {
  std::string                       name;
  std::function<std::optional<T>()> attempt;
};

template <typename T>
struct ProbeHit {
  T           value;
  std::string method;
};

template <typename T>
std::optional<ProbeHit<T>> FirstSuccess(const std::vector<Probe<T>>& probes, std::string_view what) {
  for (const auto& probe : probes) {
    try {
      if (auto value = probe.attempt()) {
        SLOTWATCH_LOG_DEBUG("probe matched", {observability::StringField("target", what), observability::StringField("method", probe.name)});
        return ProbeHit<T>{std::move(*value), probe.name};
      }
    } catch (const std::exception& e) {
      SLOTWATCH_LOG_INFO("probe failed",
                         {observability::StringField("target", what), observability::StringField("method", probe.name),
                          observability::StringField("error", e.what())});
    }
  }
  return std::nullopt;
}

} // namespace slotwatch::browser
