#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slotwatch::runtime::config {
class UserConfig;
}

namespace slotwatch::model {

/*
  What one user is looking for. Loaded once when the worker is built and
  read-only afterwards.
*/
struct UserAppointmentSpec {
  std::string              email;
  std::string              password;
  std::string              location;
  std::string              start_date;
  std::string              end_date;
  std::vector<std::string> preferred_cities;
  std::string              ivr_number;
  bool                     auto_book = false;

  static UserAppointmentSpec FromConfig(const slotwatch::runtime::config::UserConfig& user);

  // "start ~ end"
  std::string DateRangeDisplay() const;

  // Configured location, or the first preferred city when none is set.
  std::string EffectiveLocation() const;
};

struct SlotResult {
  std::string city;
  std::string date;
  std::string time;
  bool        auto_booked = false;
};

// True for labels shaped exactly like YYYY-MM-DD.
bool IsIsoDate(std::string_view value);

// Date picker cell to YYYY-MM-DD. The month is zero based, as the picker
// renders it. Empty when any part is not a plain number.
std::optional<std::string> CalendarDate(std::string_view year, std::string_view zero_based_month, std::string_view day);

// ISO dates compare lexically. Empty bounds are open.
bool DateInRange(std::string_view date, std::string_view start, std::string_view end);

} // namespace slotwatch::model
