#include "internal/notify/desktop_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace mprisrelay::notify {

bus::MethodCall BuildNotification(const std::string& summary, const std::string& body, const bus::StringList& actions,
                                  std::chrono::milliseconds timeout) {
  bus::MethodCall call;
  call.destination = kNotificationsName;
  call.path        = kNotificationsPath;
  call.interface   = kNotificationsInterface;
  call.member      = "Notify";
  call.args        = {bus::Value(kAppName),
                      bus::Value(std::uint32_t{0}),
                      bus::Value(""),
                      bus::Value(summary),
                      bus::Value(body),
                      bus::Value(actions),
                      bus::Value(bus::PropertyMap{}),
                      bus::Value(static_cast<std::int32_t>(timeout.count()))};
  return call;
}

DesktopNotifier::DesktopNotifier(std::shared_ptr<bus::Bus> bus) : bus_(std::move(bus)) {
}

void DesktopNotifier::Notify(const std::string& summary, const std::string& body) {
  if (!bus_ || !bus_->IsConnected()) return;
  try {
    bus_->Send(BuildNotification(summary, body));
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_DEBUG("Desktop notification dropped", {observability::StringField("error", e.what())});
  }
}

} // namespace mprisrelay::notify
