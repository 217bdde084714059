#pragma once

#include <string>

namespace slotwatch::notify {

/*
  Delivery sink for user-facing messages.

  Best effort: implementations log and swallow their own failures and never
  throw. The return value only reports whether the message left the process.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual bool SendNotification(const std::string& subject, const std::string& body) = 0;
};

} // namespace slotwatch::notify
