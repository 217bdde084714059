#include "internal/model/appointment.hpp"

#include <cctype>
#include <cstdio>

#include "config/config.pb.h"

namespace slotwatch::model {

UserAppointmentSpec UserAppointmentSpec::FromConfig(const slotwatch::runtime::config::UserConfig& user) {
  UserAppointmentSpec spec;
  spec.email      = user.email();
  spec.password   = user.password();
  spec.location   = user.appointment().location();
  spec.start_date = user.appointment().start_date();
  spec.end_date   = user.appointment().end_date();
  spec.ivr_number = user.appointment().ivr_number();
  spec.auto_book  = user.appointment().auto_book();
  spec.preferred_cities.assign(user.appointment().preferred_cities().begin(), user.appointment().preferred_cities().end());
  return spec;
}

std::string UserAppointmentSpec::DateRangeDisplay() const {
  return start_date + " ~ " + end_date;
}

std::string UserAppointmentSpec::EffectiveLocation() const {
  if (!location.empty() || preferred_cities.empty()) {
    return location;
  }
  return preferred_cities.front();
}

bool IsIsoDate(std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> CalendarDate(std::string_view year, std::string_view zero_based_month, std::string_view day) {
  auto parse = [](std::string_view text) -> std::optional<int> {
    if (text.empty() || text.size() > 4) {
      return std::nullopt;
    }
    int value = 0;
    for (char c : text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
      value = value * 10 + (c - '0');
    }
    return value;
  };

  const auto y = parse(year);
  const auto m = parse(zero_based_month);
  const auto d = parse(day);
  if (!y || !m || !d || *m > 11 || *d < 1 || *d > 31) {
    return std::nullopt;
  }

  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", *y, *m + 1, *d);
  return std::string(buffer);
}

bool DateInRange(std::string_view date, std::string_view start, std::string_view end) {
  if (!start.empty() && date < start) {
    return false;
  }
  if (!end.empty() && date > end) {
    return false;
  }
  return true;
}

} // namespace slotwatch::model
