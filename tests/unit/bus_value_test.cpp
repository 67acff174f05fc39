#include "internal/bus/bus.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/notify/desktop_notifier.hpp"
#include "support/fake_bus.hpp"

namespace {

using namespace mprisrelay::bus;

void TestScalarAccessors() {
  assert(AsBool(Value(true)).value());
  assert(!AsBool(Value(std::int32_t{1})).has_value());

  assert(AsInt64(Value(std::int32_t{-5})).value() == -5);
  assert(AsInt64(Value(std::uint32_t{7})).value() == 7);
  assert(AsInt64(Value(std::uint64_t{1} << 40)).value() == (std::int64_t{1} << 40));
  assert(AsInt64(Value(2.0)).value() == 2);
  assert(!AsInt64(Value(2.5)).has_value());
  assert(!AsInt64(Value("12")).has_value());

  assert(AsDouble(Value(0.75)).value() == 0.75);
  assert(AsDouble(Value(std::int64_t{3})).value() == 3.0);
  assert(!AsDouble(Value(true)).has_value());
}

void TestStringAccessors() {
  assert(AsString(Value("abc")).value() == "abc");
  assert(AsString(Value(ObjectPath{"/org/mpris/MediaPlayer2/Track/3"})).value() == "/org/mpris/MediaPlayer2/Track/3");
  assert(!AsString(Value(std::int32_t{1})).has_value());

  auto list = AsStringList(Value(StringList{"a", "b"}));
  assert(list && list->size() == 2 && (*list)[1] == "b");

  // Some players publish xesam:artist as a plain string.
  auto single = AsStringList(Value("Solo"));
  assert(single && single->size() == 1 && single->front() == "Solo");
}

void TestVariantsAreUnwrapped() {
  auto nested = WrapVariant(WrapVariant(Value(std::int64_t{42})));
  assert(AsInt64(nested).value() == 42);

  PropertyMap meta{{"xesam:title", Value("T")}};
  auto        wrapped = WrapVariant(Value(meta));
  const auto* map     = AsMap(wrapped);
  assert(map != nullptr);
  assert(AsString(*Find(*map, "xesam:title")).value() == "T");
  assert(Find(*map, "xesam:album") == nullptr);
  assert(AsMap(Value("x")) == nullptr);
  assert(Value().IsNull());
}

void TestSignalMatching() {
  Signal owner_changed{kBusName, kBusPath, kBusInterface, "NameOwnerChanged",
                       {Value("org.mpris.MediaPlayer2.vlc"), Value(""), Value(":1.9")}};

  SignalMatch any;
  assert(Matches(any, owner_changed));

  SignalMatch mpris;
  mpris.interface      = kBusInterface;
  mpris.member         = "NameOwnerChanged";
  mpris.arg0_namespace = "org.mpris.MediaPlayer2";
  assert(Matches(mpris, owner_changed));

  // Namespace match is on whole dotted components.
  Signal lookalike = owner_changed;
  lookalike.args[0] = Value("org.mpris.MediaPlayer2Extra");
  assert(!Matches(mpris, lookalike));

  Signal exact = owner_changed;
  exact.args[0] = Value("org.mpris.MediaPlayer2");
  assert(Matches(mpris, exact));

  Signal no_args = owner_changed;
  no_args.args.clear();
  assert(!Matches(mpris, no_args));

  SignalMatch from_other;
  from_other.sender = ":1.2";
  assert(!Matches(from_other, owner_changed));

  SignalMatch wrong_member;
  wrong_member.member = "NameLost";
  assert(!Matches(wrong_member, owner_changed));
}

void TestConvenienceCalls() {
  mprisrelay::testing::FakeBus bus;
  bus.Register("org.mpris.MediaPlayer2.vlc", mprisrelay::testing::StandardPlayer(":1.5", "VLC"));

  auto names = ListNames(bus);
  assert(names.size() == 2);
  assert(GetNameOwner(bus, "org.mpris.MediaPlayer2.vlc") == ":1.5");

  bool threw = false;
  try {
    GetNameOwner(bus, "org.mpris.MediaPlayer2.gone");
  } catch (const BusError& e) {
    threw = e.Name() == "org.freedesktop.DBus.Error.NameHasNoOwner";
  }
  assert(threw);

  auto root = GetAllProperties(bus, "org.mpris.MediaPlayer2.vlc", "/org/mpris/MediaPlayer2", "org.mpris.MediaPlayer2");
  assert(AsString(*Find(root, "Identity")).value() == "VLC");

  SetProperty(bus, "org.mpris.MediaPlayer2.vlc", "/org/mpris/MediaPlayer2", "org.mpris.MediaPlayer2.Player", "Rate",
              Value(1.5));
  auto calls = bus.Calls();
  assert(calls.back().member == "Set");
  assert(calls.back().args.size() == 3);
  assert(std::holds_alternative<Variant>(calls.back().args[2].data));
  assert(AsDouble(calls.back().args[2]).value() == 1.5);
}

void TestDesktopNotification() {
  auto call = mprisrelay::notify::BuildNotification("Pairing request", "Code: 1234", {"accept", "Accept"});
  assert(call.destination == mprisrelay::notify::kNotificationsName);
  assert(call.member == "Notify");
  assert(call.args.size() == 8);
  assert(AsString(call.args[0]).value() == "mprisrelay");
  assert(AsString(call.args[3]).value() == "Pairing request");
  assert(AsString(call.args[4]).value() == "Code: 1234");
  assert(AsStringList(call.args[5])->size() == 2);
  assert(AsInt64(call.args[7]).value() == -1);

  auto bus = std::make_shared<mprisrelay::testing::FakeBus>();
  mprisrelay::notify::DesktopNotifier notifier(bus);
  notifier.Notify("Pairing complete", "phone");
  assert(bus->Sent().size() == 1);

  bus->Disconnect();
  notifier.Notify("dropped", "");
  assert(bus->Sent().size() == 1);
}

} // namespace

int main() {
  TestScalarAccessors();
  TestStringAccessors();
  TestVariantsAreUnwrapped();
  TestSignalMatching();
  TestConvenienceCalls();
  TestDesktopNotification();

  std::cout << "mprisrelay_unit_bus_value: pass\n";
  return 0;
}
