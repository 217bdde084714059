#include "internal/debug/artifact_writer.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::debug {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path.string());
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

} // namespace

ArtifactSettings ArtifactSettings::FromConfig(const slotwatch::runtime::config::RuntimeConfig& config) {
  ArtifactSettings settings;
  settings.enabled          = config.debug().enabled();
  settings.save_screenshots = !config.debug().has_save_screenshots() || config.debug().save_screenshots();
  settings.save_html        = !config.debug().has_save_html() || config.debug().save_html();
  if (!config.storage().logs_dir().empty()) {
    settings.logs_dir = config.storage().logs_dir();
  }
  return settings;
}

ArtifactWriter::ArtifactWriter(ArtifactSettings settings, util::ClockFn clock) : settings_(std::move(settings)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = util::Now;
  }

  std::error_code ec;
  fs::create_directories(settings_.logs_dir, ec);
  if (ec || !fs::is_directory(settings_.logs_dir)) {
    throw util::InitializationError("cannot create logs directory " + settings_.logs_dir.string() + ": " + ec.message());
  }

  const auto removed = PurgeOld();
  if (removed > 0) {
    SLOTWATCH_LOG_INFO("removed old debug artifacts", {observability::IntField("count", static_cast<std::int64_t>(removed))});
  }
}

std::size_t ArtifactWriter::PurgeOld() const {
  std::size_t     removed = 0;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(settings_.logs_dir, ec)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const auto extension = entry.path().extension();
    if (extension != ".png" && extension != ".html") {
      continue;
    }
    std::error_code remove_ec;
    if (fs::remove(entry.path(), remove_ec)) {
      ++removed;
    } else if (remove_ec) {
      SLOTWATCH_LOG_WARN("failed to remove debug artifact", {StringField("path", entry.path().string()), StringField("error", remove_ec.message())});
    }
  }
  if (ec) {
    SLOTWATCH_LOG_WARN("failed to list logs directory", {StringField("path", settings_.logs_dir.string()), StringField("error", ec.message())});
  }
  return removed;
}

model::DebugArtifact ArtifactWriter::Capture(browser::BrowserDriver& driver, const std::string& prefix) const {
  model::DebugArtifact artifact;
  artifact.captured_at = clock_();
  artifact.prefix      = prefix;

  try {
    artifact.current_url = driver.CurrentUrl();
  } catch (const std::exception& e) {
    artifact.current_url = "unknown";
    SLOTWATCH_LOG_DEBUG("current url unavailable for debug capture", {StringField("error", e.what())});
  }

  if (!settings_.enabled) {
    const bool is_error = util::ContainsIgnoreCase(prefix, "error");
    observability::Log(is_error ? spdlog::level::err : spdlog::level::info, "debug checkpoint",
                       {StringField("prefix", prefix), StringField("url", artifact.current_url)});
    return artifact;
  }

  const std::string stem = prefix + "_" + util::FormatCompact(artifact.captured_at);

  if (settings_.save_screenshots) {
    const auto path = settings_.logs_dir / (stem + ".png");
    try {
      WriteFile(path, driver.Screenshot());
      artifact.screenshot_path = path.string();
      SLOTWATCH_LOG_INFO("screenshot saved", {StringField("path", artifact.screenshot_path)});
    } catch (const std::exception& e) {
      SLOTWATCH_LOG_ERROR("failed to save screenshot", {StringField("prefix", prefix), StringField("error", e.what())});
    }
  }

  if (settings_.save_html) {
    const auto path = settings_.logs_dir / (stem + ".html");
    try {
      WriteFile(path, driver.PageSource());
      artifact.page_source_path = path.string();
      SLOTWATCH_LOG_INFO("page source saved", {StringField("path", artifact.page_source_path)});
    } catch (const std::exception& e) {
      SLOTWATCH_LOG_ERROR("failed to save page source", {StringField("prefix", prefix), StringField("error", e.what())});
    }
  }

  return artifact;
}

} // namespace slotwatch::debug
