#include "internal/state/state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identity.hpp"

namespace slotwatch::state {

namespace fs = std::filesystem;

using observability::StringField;
using slotwatch::v1::WorkerState;

namespace {

constexpr const char* kStateSuffix = "_state.json";

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

StateStore::StateStore(fs::path dir, util::ClockFn clock) : dir_(std::move(dir)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = util::Now;
  }

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec || !fs::is_directory(dir_)) {
    throw util::InitializationError("cannot create state directory " + dir_.string() + ": " + ec.message());
  }

  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    if (!entry.is_regular_file() || !EndsWith(entry.path().filename().string(), kStateSuffix)) {
      continue;
    }
    auto state = LoadFile(entry.path());
    if (state && !state->email().empty()) {
      states_[state->email()] = std::move(*state);
    }
  }

  SLOTWATCH_LOG_INFO("state store ready",
                     {StringField("dir", dir_.string()), observability::IntField("records", static_cast<std::int64_t>(states_.size()))});
}

fs::path StateStore::PathFor(const std::string& email) const {
  return dir_ / (util::StableKey(email) + kStateSuffix);
}

std::optional<WorkerState> StateStore::LoadFile(const fs::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  WorkerState                              state;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &state, options);
  if (!status.ok()) {
    SLOTWATCH_LOG_WARN("ignoring unreadable state file", {StringField("path", path.string()), StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return state;
}

WorkerState& StateStore::RecordLocked(const std::string& email) {
  auto it = states_.find(email);
  if (it != states_.end()) {
    return it->second;
  }

  WorkerState state;
  if (auto loaded = LoadFile(PathFor(email))) {
    state = std::move(*loaded);
  } else {
    state.set_status(std::string(model::ToString(model::WorkerStatus::kInitializing)));
  }
  state.set_email(email);
  return states_.emplace(email, std::move(state)).first->second;
}

void StateStore::SaveLocked(const WorkerState& state) const {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(state, &json, options);
  if (!status.ok()) {
    SLOTWATCH_LOG_ERROR("failed to encode state", {StringField("user", state.email()), StringField("error", std::string(status.message()))});
    return;
  }

  const auto path = PathFor(state.email());
  auto       tmp  = path;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << json;
    if (!out) {
      SLOTWATCH_LOG_ERROR("failed to write state file", {StringField("path", tmp.string())});
      return;
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    SLOTWATCH_LOG_ERROR("failed to replace state file", {StringField("path", path.string()), StringField("error", ec.message())});
  }
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------

WorkerState StateStore::GetOrCreate(const std::string& email) {
  std::lock_guard lock(mutex_);
  return RecordLocked(email);
}

WorkerState StateStore::Update(const std::string& email, model::WorkerStatus status, const std::string& date_range, const std::string& location,
                               bool slot_available, const std::string& notes) {
  std::lock_guard lock(mutex_);
  auto&           state = RecordLocked(email);
  const auto      now   = clock_();

  state.set_status(std::string(model::ToString(status)));
  *state.mutable_last_checked_at() = util::ToProto(now);
  state.set_date_range(date_range);
  state.set_location(location);
  if (slot_available) {
    *state.mutable_last_slot_found_at() = util::ToProto(now);
  }
  state.set_slot_available(slot_available);
  state.set_notes(notes);

  SaveLocked(state);
  return state;
}

WorkerState StateStore::UpdateLoginState(const std::string& email, bool logged_in) {
  std::lock_guard lock(mutex_);
  auto&           state = RecordLocked(email);

  state.set_status(std::string(model::ToString(logged_in ? model::WorkerStatus::kLoggedIn : model::WorkerStatus::kLoginFailed)));
  *state.mutable_last_checked_at() = util::ToProto(clock_());
  state.set_notes(logged_in ? "Successfully logged in" : "Login failed");

  SaveLocked(state);
  SLOTWATCH_LOG_INFO("login state updated", {StringField("user", email), StringField("status", state.status())});
  return state;
}

std::optional<WorkerState> StateStore::Get(const std::string& email) const {
  std::lock_guard lock(mutex_);
  auto            it = states_.find(email);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<WorkerState> StateStore::List() const {
  std::vector<WorkerState> result;
  {
    std::lock_guard lock(mutex_);
    result.reserve(states_.size());
    for (const auto& [email, state] : states_) {
      result.push_back(state);
    }
  }
  std::sort(result.begin(), result.end(), [](const WorkerState& a, const WorkerState& b) { return a.email() < b.email(); });
  return result;
}

} // namespace slotwatch::state
