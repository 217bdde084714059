#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace slotwatch::model {

// Record of one capture. Paths stay empty when the file was not written.
struct DebugArtifact {
  util::TimePoint captured_at;
  std::string     prefix;
  std::string     screenshot_path;
  std::string     page_source_path;
  std::string     current_url;
};

} // namespace slotwatch::model
