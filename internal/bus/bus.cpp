#include "internal/bus/bus.hpp"

namespace mprisrelay::bus {

bool Matches(const SignalMatch& match, const Signal& signal) {
  if (!match.sender.empty() && match.sender != signal.sender) return false;
  if (!match.path.empty() && match.path != signal.path) return false;
  if (!match.interface.empty() && match.interface != signal.interface) return false;
  if (!match.member.empty() && match.member != signal.member) return false;

  if (!match.arg0_namespace.empty()) {
    if (signal.args.empty()) return false;
    auto arg0 = AsString(signal.args.front());
    if (!arg0) return false;
    const auto& ns = match.arg0_namespace;
    if (*arg0 != ns && !(arg0->size() > ns.size() && arg0->compare(0, ns.size(), ns) == 0 && (*arg0)[ns.size()] == '.')) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> ListNames(Bus& bus) {
  auto reply = bus.Call({kBusName, kBusPath, kBusInterface, "ListNames", {}});
  if (reply.empty()) return {};
  return AsStringList(reply.front()).value_or(std::vector<std::string>{});
}

std::string GetNameOwner(Bus& bus, const std::string& name) {
  auto reply = bus.Call({kBusName, kBusPath, kBusInterface, "GetNameOwner", {Value(name)}});
  if (reply.empty()) throw BusError("org.freedesktop.DBus.Error.InvalidArgs", "GetNameOwner returned nothing");
  auto owner = AsString(reply.front());
  if (!owner) throw BusError("org.freedesktop.DBus.Error.InvalidArgs", "GetNameOwner returned a non-string");
  return *owner;
}

PropertyMap GetAllProperties(Bus& bus, const std::string& destination, const std::string& path,
                             const std::string& interface, std::chrono::milliseconds timeout) {
  auto reply = bus.Call({destination, path, kProperties, "GetAll", {Value(interface)}}, timeout);
  if (reply.empty()) return {};
  const auto* map = AsMap(reply.front());
  return map ? *map : PropertyMap{};
}

void SetProperty(Bus& bus, const std::string& destination, const std::string& path, const std::string& interface,
                 const std::string& name, Value value, std::chrono::milliseconds timeout) {
  bus.Call({destination, path, kProperties, "Set", {Value(interface), Value(name), WrapVariant(std::move(value))}}, timeout);
}

} // namespace mprisrelay::bus
