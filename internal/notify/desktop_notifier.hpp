#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/bus/bus.hpp"
#include "internal/notify/notifier.hpp"

namespace mprisrelay::notify {

inline constexpr const char* kNotificationsName      = "org.freedesktop.Notifications";
inline constexpr const char* kNotificationsPath      = "/org/freedesktop/Notifications";
inline constexpr const char* kNotificationsInterface = "org.freedesktop.Notifications";
inline constexpr const char* kAppName                = "mprisrelay";

// Notify(app, replaces, icon, summary, body, actions, hints, timeout).
// `actions` alternates key and label. A zero timeout means the server
// default; a negative one never expires.
bus::MethodCall BuildNotification(const std::string& summary, const std::string& body,
                                  const bus::StringList& actions = {},
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(-1));

/*
  Posts notifications to the desktop notification server over the
  session bus without waiting for the reply.
*/
class DesktopNotifier final : public Notifier {
 public:
  explicit DesktopNotifier(std::shared_ptr<bus::Bus> bus);

  void Notify(const std::string& summary, const std::string& body) override;

 private:
  std::shared_ptr<bus::Bus> bus_;
};

} // namespace mprisrelay::notify
