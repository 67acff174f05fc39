#pragma once

#include <dbus/dbus.h>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/bus/bus.hpp"

namespace mprisrelay::bus {

/*
  DbusSessionBus

  Bus implementation on libdbus over a private session-bus connection.
  A dedicated thread runs read/write/dispatch; signals are delivered to
  subscribers from there. Method calls block the calling thread only.

  When the connection drops the dispatch thread invokes the disconnect
  handler once and exits. The object is then dead; reconnecting means
  calling Connect() again.
*/
class DbusSessionBus final : public Bus {
  struct ConnectTag {
    explicit ConnectTag() = default;
  };

 public:
  // Throws BusError when the session bus cannot be reached.
  static std::shared_ptr<DbusSessionBus> Connect();

  // Reachable only through Connect().
  DbusSessionBus(ConnectTag, DBusConnection* connection);
  ~DbusSessionBus() override;

  DbusSessionBus(const DbusSessionBus&)            = delete;
  DbusSessionBus& operator=(const DbusSessionBus&) = delete;

  std::vector<Value> Call(const MethodCall& call, std::chrono::milliseconds timeout) override;
  void               Send(const MethodCall& call) override;

  SubscriptionId Subscribe(const SignalMatch& match, SignalHandler handler) override;
  void           Unsubscribe(SubscriptionId id) override;

  void SetDisconnectHandler(std::function<void()> handler) override;
  bool IsConnected() const override;

  const std::string& UniqueName() const {
    return unique_name_;
  }

  // Stops dispatching and closes the connection. Must not be called from
  // a signal or disconnect handler.
  void Close();

 private:
  static DBusHandlerResult Filter(DBusConnection* connection, DBusMessage* message, void* self);

  void DispatchLoop();
  void Deliver(const Signal& signal);
  void NotifyDisconnected();

  struct Subscription {
    SignalMatch   match;
    std::string   rule;
    SignalHandler handler;
  };

  DBusConnection* connection_;
  std::string     unique_name_;

  std::atomic<bool> running_{true};
  std::atomic<bool> connected_{true};
  std::thread       dispatcher_;

  std::mutex                             mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId                         next_id_ = 1;
  std::function<void()>                  on_disconnect_;
  bool                                   disconnect_fired_ = false;
};

} // namespace mprisrelay::bus
