#pragma once

#include <string>

namespace mprisrelay::notify {

/*
  Fire-and-forget desktop notifications. Implementations must not block
  and must not throw; a lost notification is acceptable.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const std::string& summary, const std::string& body) = 0;
};

} // namespace mprisrelay::notify
