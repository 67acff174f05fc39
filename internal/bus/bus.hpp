#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/bus/value.hpp"

namespace mprisrelay::bus {

inline constexpr auto kDefaultCallTimeout = std::chrono::milliseconds(2000);

inline constexpr const char* kBusName      = "org.freedesktop.DBus";
inline constexpr const char* kBusPath      = "/org/freedesktop/DBus";
inline constexpr const char* kBusInterface = "org.freedesktop.DBus";
inline constexpr const char* kProperties   = "org.freedesktop.DBus.Properties";

// A failed call. `name` is the bus error name, e.g.
// org.freedesktop.DBus.Error.ServiceUnknown.
class BusError : public std::runtime_error {
 public:
  BusError(std::string name, const std::string& message)
      : std::runtime_error(name + ": " + message), name_(std::move(name)) {
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  std::string name_;
};

struct MethodCall {
  std::string        destination;
  std::string        path;
  std::string        interface;
  std::string        member;
  std::vector<Value> args;
};

// Empty fields match anything.
struct SignalMatch {
  std::string sender;
  std::string path;
  std::string interface;
  std::string member;
  // Matches when the first argument equals this or starts with it plus '.'
  std::string arg0_namespace;
};

struct Signal {
  std::string        sender;
  std::string        path;
  std::string        interface;
  std::string        member;
  std::vector<Value> args;
};

bool Matches(const SignalMatch& match, const Signal& signal);

/*
  Bus

  The session object bus as the agent consumes it: method calls, fire-and-
  forget sends and signal subscriptions. Signal handlers and the
  disconnect handler run on the bus's own dispatch thread and must not
  block or call back into the bus.
*/
class Bus {
 public:
  using SignalHandler  = std::function<void(const Signal&)>;
  using SubscriptionId = std::uint64_t;

  virtual ~Bus() = default;

  // Throws BusError.
  virtual std::vector<Value> Call(const MethodCall& call, std::chrono::milliseconds timeout = kDefaultCallTimeout) = 0;

  // No reply is requested; failures are dropped.
  virtual void Send(const MethodCall& call) = 0;

  virtual SubscriptionId Subscribe(const SignalMatch& match, SignalHandler handler) = 0;
  virtual void           Unsubscribe(SubscriptionId id) = 0;

  virtual void SetDisconnectHandler(std::function<void()> handler) = 0;
  virtual bool IsConnected() const                                 = 0;
};

// ------------------------------------------------------------
// Convenience calls built on Bus::Call
// ------------------------------------------------------------

std::vector<std::string> ListNames(Bus& bus);

// Unique connection name (":1.42") owning `name`; throws BusError.
std::string GetNameOwner(Bus& bus, const std::string& name);

PropertyMap GetAllProperties(Bus& bus, const std::string& destination, const std::string& path,
                             const std::string& interface, std::chrono::milliseconds timeout = kDefaultCallTimeout);

void SetProperty(Bus& bus, const std::string& destination, const std::string& path, const std::string& interface,
                 const std::string& name, Value value, std::chrono::milliseconds timeout = kDefaultCallTimeout);

} // namespace mprisrelay::bus
