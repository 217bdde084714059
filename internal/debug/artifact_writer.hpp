#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "internal/browser/browser_driver.hpp"
#include "internal/model/debug_artifact.hpp"
#include "internal/util/time.hpp"

namespace slotwatch::runtime::config {
class RuntimeConfig;
}

namespace slotwatch::debug {

struct ArtifactSettings {
  bool                  enabled          = false;
  bool                  save_screenshots = true;
  bool                  save_html        = true;
  std::filesystem::path logs_dir{"logs"};

  static ArtifactSettings FromConfig(const slotwatch::runtime::config::RuntimeConfig& config);
};

/*
  Writes <prefix>_<yyyyMMdd_HHmmss>.png and .html under the logs directory
  when debug mode is on; otherwise only logs the event. Capture never throws.
*/
class ArtifactWriter {
 public:
  // Creates the logs directory and removes artifacts left by earlier runs.
  // Throws util::InitializationError when the directory cannot be created.
  explicit ArtifactWriter(ArtifactSettings settings, util::ClockFn clock = util::Now);

  model::DebugArtifact Capture(browser::BrowserDriver& driver, const std::string& prefix) const;

  std::size_t PurgeOld() const;

  const ArtifactSettings& settings() const {
    return settings_;
  }

 private:
  ArtifactSettings settings_;
  util::ClockFn    clock_;
};

} // namespace slotwatch::debug
