#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/browser/browser_driver.hpp"
#include "internal/model/appointment.hpp"
#include "internal/navigation/navigation_options.hpp"
#include "internal/navigation/page_markers.hpp"

namespace slotwatch::scanner {

struct ScanOutcome {
  // The site answered "busy" at some point; slots holds what was read before.
  bool                            busy = false;
  std::vector<model::SlotResult> slots;
  std::size_t                     dates_seen = 0;
};

/*
  Reads open slots from the reschedule page.

    select location -> open date picker -> for each selectable date:
    click, read time options (first option is a placeholder)

  A busy page short-circuits the scan with busy = true. Errors on a single
  date are logged and the next date is tried. Dates labelled YYYY-MM-DD that
  fall outside the requested range are skipped.
*/
class SlotScanner {
 public:
  using StopFn = std::function<bool()>;

  SlotScanner(navigation::NavigationOptions options, navigation::PageMarkers markers);

  ScanOutcome Scan(browser::BrowserDriver& driver, const model::UserAppointmentSpec& spec, const StopFn& stop_requested = {}) const;

  // Submits slot from the reschedule page and waits for the confirmation
  // page. False when the slot could not be booked; the cause is logged.
  bool Book(browser::BrowserDriver& driver, const model::SlotResult& slot) const;

 private:
  void SelectLocation(browser::BrowserDriver& driver, const std::string& location) const;
  bool OpenDatePicker(browser::BrowserDriver& driver) const;
  std::vector<std::string> ReadTimes(browser::BrowserDriver& driver) const;

  navigation::NavigationOptions options_;
  navigation::PageMarkers       markers_;
};

} // namespace slotwatch::scanner
