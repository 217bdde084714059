#include "internal/scanner/slot_scanner.hpp"

#include <algorithm>
#include <utility>

#include "internal/browser/wait.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::scanner {

using browser::Element;
using browser::Locator;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kDateInputId     = "appointments_consulate_appointment_date";
constexpr const char* kTimeSelectId    = "appointments_consulate_appointment_time";
constexpr const char* kCalendarClass   = "ui-datepicker-calendar";
constexpr const char* kSelectableDays  = ".ui-datepicker-calendar td:not(.ui-datepicker-unselectable)";
constexpr const char* kSubmitId        = "appointments_submit";
constexpr const char* kConfirmation    = "confirmation-page";

struct DateCell {
  Element     element;
  std::string label;
};

// The day number sits on the link; year and zero based month on its cell.
std::string DateLabel(browser::BrowserDriver& driver, const Element& day, const Element& link) {
  auto number = driver.Attribute(link, "data-date");
  if (!number || number->empty()) {
    number = util::Trim(driver.Text(link));
  }

  const auto year  = driver.Attribute(day, "data-year");
  const auto month = driver.Attribute(day, "data-month");
  if (year && month) {
    if (auto date = model::CalendarDate(*year, *month, *number)) {
      return *date;
    }
  }
  return *number;
}

std::vector<DateCell> SelectableDates(browser::BrowserDriver& driver) {
  std::vector<DateCell> cells;
  for (const auto& day : driver.FindElements(Locator::Css(kSelectableDays))) {
    auto links = driver.FindChildren(day, Locator::TagName("a"));
    if (links.empty()) {
      continue;
    }
    cells.push_back({links.front(), DateLabel(driver, day, links.front())});
  }
  return cells;
}

} // namespace

SlotScanner::SlotScanner(navigation::NavigationOptions options, navigation::PageMarkers markers)
    : options_(std::move(options)), markers_(std::move(markers)) {
}

ScanOutcome SlotScanner::Scan(browser::BrowserDriver& driver, const model::UserAppointmentSpec& spec, const StopFn& stop_requested) const {
  observability::SpanScope span("scanner.scan");
  ScanOutcome              outcome;

  const auto location = spec.EffectiveLocation();
  if (!location.empty()) {
    SelectLocation(driver, location);
    if (markers_.IsBusy(driver)) {
      SLOTWATCH_LOG_WARN("system busy after selecting location");
      outcome.busy = true;
      return outcome;
    }
  }

  if (!OpenDatePicker(driver)) {
    outcome.busy = true;
    return outcome;
  }

  const auto cells   = SelectableDates(driver);
  outcome.dates_seen = cells.size();

  if (cells.empty()) {
    SLOTWATCH_LOG_INFO("no selectable dates");
    return outcome;
  }
  SLOTWATCH_LOG_INFO("selectable dates found", {IntField("count", static_cast<std::int64_t>(cells.size()))});

  for (const auto& cell : cells) {
    if (stop_requested && stop_requested()) {
      SLOTWATCH_LOG_INFO("scan interrupted by stop request");
      break;
    }

    if (model::IsIsoDate(cell.label) && !model::DateInRange(cell.label, spec.start_date, spec.end_date)) {
      SLOTWATCH_LOG_DEBUG("date outside requested range", {StringField("date", cell.label)});
      continue;
    }

    try {
      driver.Click(cell.element);
      browser::Pause(options_.post_click_delay);

      if (markers_.IsBusy(driver)) {
        SLOTWATCH_LOG_WARN("system busy after selecting date", {StringField("date", cell.label)});
        outcome.busy = true;
        break;
      }

      for (auto& time : ReadTimes(driver)) {
        SLOTWATCH_LOG_INFO("open slot", {StringField("date", cell.label), StringField("time", time)});
        outcome.slots.push_back(model::SlotResult{location, cell.label, std::move(time), false});
      }
    } catch (const std::exception& e) {
      if (markers_.IsBusy(driver)) {
        SLOTWATCH_LOG_WARN("system busy while reading date", {StringField("date", cell.label)});
        outcome.busy = true;
        break;
      }
      SLOTWATCH_LOG_ERROR("failed to read date", {StringField("date", cell.label), StringField("error", e.what())});
    }
  }

  span.SetAttribute("slots", static_cast<std::int64_t>(outcome.slots.size()));
  return outcome;
}

bool SlotScanner::Book(browser::BrowserDriver& driver, const model::SlotResult& slot) const {
  observability::SpanScope span("scanner.book");
  SLOTWATCH_LOG_INFO("booking appointment", {StringField("city", slot.city), StringField("date", slot.date), StringField("time", slot.time)});

  try {
    if (!OpenDatePicker(driver)) {
      SLOTWATCH_LOG_WARN("system busy, booking skipped");
      return false;
    }

    const auto cells = SelectableDates(driver);
    auto       cell  = std::find_if(cells.begin(), cells.end(), [&](const DateCell& c) { return c.label == slot.date; });
    if (cell == cells.end()) {
      throw util::ElementNotFound("date no longer offered: " + slot.date);
    }
    driver.Click(cell->element);
    browser::Pause(options_.post_click_delay);

    auto select = browser::WaitForElement(driver, Locator::Id(kTimeSelectId), options_.ElementWait());
    bool chosen = false;
    for (const auto& option : driver.FindChildren(select, Locator::TagName("option"))) {
      if (util::Trim(driver.Text(option)) == slot.time) {
        driver.Click(option);
        chosen = true;
        break;
      }
    }
    if (!chosen) {
      throw util::ElementNotFound("time no longer offered: " + slot.time);
    }

    auto submit = browser::WaitForClickable(driver, Locator::Id(kSubmitId), options_.ElementWait());
    browser::ScrollAndClick(driver, submit, options_.settle_delay);
    browser::WaitForElement(driver, Locator::ClassName(kConfirmation), options_.PageWait());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    SLOTWATCH_LOG_ERROR("booking failed", {StringField("date", slot.date), StringField("time", slot.time), StringField("error", e.what())});
    return false;
  }

  SLOTWATCH_LOG_INFO("appointment booked", {StringField("date", slot.date), StringField("time", slot.time)});
  return true;
}

void SlotScanner::SelectLocation(browser::BrowserDriver& driver, const std::string& location) const {
  auto select = browser::WaitForElement(driver, Locator::Id(options_.facility_select_id), options_.PageWait());
  driver.Click(select);

  for (const auto& option : driver.FindChildren(select, Locator::TagName("option"))) {
    if (util::Contains(util::Trim(driver.Text(option)), location)) {
      driver.Click(option);
      browser::Pause(options_.post_click_delay);
      SLOTWATCH_LOG_INFO("location selected", {StringField("location", location)});
      return;
    }
  }

  throw util::NavigationFailed("location not offered: " + location);
}

bool SlotScanner::OpenDatePicker(browser::BrowserDriver& driver) const {
  try {
    auto input = browser::WaitForClickable(driver, Locator::Id(kDateInputId), options_.ElementWait());
    driver.Click(input);
    browser::WaitForElement(driver, Locator::ClassName(kCalendarClass), options_.ElementWait());
  } catch (const std::exception&) {
    if (markers_.IsBusy(driver)) {
      SLOTWATCH_LOG_WARN("system busy while opening date picker");
      return false;
    }
    throw;
  }

  if (markers_.IsBusy(driver)) {
    SLOTWATCH_LOG_WARN("system busy after opening date picker");
    return false;
  }
  return true;
}

std::vector<std::string> SlotScanner::ReadTimes(browser::BrowserDriver& driver) const {
  auto select  = browser::WaitForElement(driver, Locator::Id(kTimeSelectId), options_.ElementWait());
  auto options = driver.FindChildren(select, Locator::TagName("option"));

  std::vector<std::string> times;
  for (std::size_t i = 1; i < options.size(); ++i) {
    auto text = util::Trim(driver.Text(options[i]));
    if (!text.empty()) {
      times.push_back(std::move(text));
    }
  }
  return times;
}

} // namespace slotwatch::scanner
