#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/worker_status.hpp"
#include "internal/util/time.hpp"
#include "slotwatch/v1/worker_state.pb.h"

namespace slotwatch::state {

/*
  File-backed per-user status records.

  One JSON file per user, <StableKey(email)>_state.json, rewritten in full
  on every update (temp file + rename). A missing or unreadable file means
  no prior state. Records are created on first access and never deleted.
*/
class StateStore {
 public:
  // Creates the directory and loads every readable record in it.
  // Throws util::InitializationError when the directory cannot be created.
  explicit StateStore(std::filesystem::path dir, util::ClockFn clock = util::Now);

  slotwatch::v1::WorkerState GetOrCreate(const std::string& email);

  // Stamps last_checked_at; stamps last_slot_found_at when slot_available.
  slotwatch::v1::WorkerState Update(const std::string& email, model::WorkerStatus status, const std::string& date_range,
                                    const std::string& location, bool slot_available, const std::string& notes);

  // logged_in / login_failed with a fixed note; other fields are kept.
  slotwatch::v1::WorkerState UpdateLoginState(const std::string& email, bool logged_in);

  std::optional<slotwatch::v1::WorkerState> Get(const std::string& email) const;
  std::vector<slotwatch::v1::WorkerState>   List() const;

  std::filesystem::path PathFor(const std::string& email) const;

 private:
  slotwatch::v1::WorkerState& RecordLocked(const std::string& email);
  void                        SaveLocked(const slotwatch::v1::WorkerState& state) const;

  std::optional<slotwatch::v1::WorkerState> LoadFile(const std::filesystem::path& path) const;

  std::filesystem::path dir_;
  util::ClockFn         clock_;

  mutable std::mutex                                          mutex_;
  std::unordered_map<std::string, slotwatch::v1::WorkerState> states_;
};

} // namespace slotwatch::state
