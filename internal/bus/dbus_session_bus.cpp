#include "internal/bus/dbus_session_bus.hpp"

#include <cstring>
#include <type_traits>
#include <variant>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace mprisrelay::bus {

namespace {

// RAII over DBusError.
struct ErrorGuard {
  DBusError error;

  ErrorGuard() {
    dbus_error_init(&error);
  }
  ~ErrorGuard() {
    dbus_error_free(&error);
  }

  bool IsSet() const {
    return dbus_error_is_set(&error);
  }

  [[noreturn]] void Throw(const std::string& context) const {
    throw BusError(error.name ? error.name : "org.freedesktop.DBus.Error.Failed",
                   context + ": " + (error.message ? error.message : "unknown error"));
  }
};

struct MessageDeleter {
  void operator()(DBusMessage* message) const {
    if (message) dbus_message_unref(message);
  }
};

using MessagePtr = std::unique_ptr<DBusMessage, MessageDeleter>;

[[noreturn]] void ThrowNoMemory() {
  throw BusError("org.freedesktop.DBus.Error.NoMemory", "out of memory while building message");
}

// ------------------------------------------------------------
// Encoding
// ------------------------------------------------------------

std::string SignatureOf(const Value& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          throw BusError("org.freedesktop.DBus.Error.InvalidArgs", "cannot encode an empty value");
        } else if constexpr (std::is_same_v<T, bool>) {
          return DBUS_TYPE_BOOLEAN_AS_STRING;
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
          return DBUS_TYPE_INT32_AS_STRING;
        } else if constexpr (std::is_same_v<T, std::uint32_t>) {
          return DBUS_TYPE_UINT32_AS_STRING;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return DBUS_TYPE_INT64_AS_STRING;
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          return DBUS_TYPE_UINT64_AS_STRING;
        } else if constexpr (std::is_same_v<T, double>) {
          return DBUS_TYPE_DOUBLE_AS_STRING;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return DBUS_TYPE_STRING_AS_STRING;
        } else if constexpr (std::is_same_v<T, ObjectPath>) {
          return DBUS_TYPE_OBJECT_PATH_AS_STRING;
        } else if constexpr (std::is_same_v<T, StringList>) {
          return "as";
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const PropertyMap>>) {
          return "a{sv}";
        } else {
          return DBUS_TYPE_VARIANT_AS_STRING;
        }
      },
      value.data);
}

void AppendBasic(DBusMessageIter* iter, int type, const void* value) {
  if (!dbus_message_iter_append_basic(iter, type, value)) ThrowNoMemory();
}

void Encode(DBusMessageIter* iter, const Value& value);

void EncodeVariant(DBusMessageIter* iter, const Value& inner) {
  const auto      signature = SignatureOf(inner);
  DBusMessageIter sub;
  if (!dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, signature.c_str(), &sub)) ThrowNoMemory();
  Encode(&sub, inner);
  if (!dbus_message_iter_close_container(iter, &sub)) ThrowNoMemory();
}

void Encode(DBusMessageIter* iter, const Value& value) {
  std::visit(
      [iter](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          throw BusError("org.freedesktop.DBus.Error.InvalidArgs", "cannot encode an empty value");
        } else if constexpr (std::is_same_v<T, bool>) {
          dbus_bool_t b = v ? TRUE : FALSE;
          AppendBasic(iter, DBUS_TYPE_BOOLEAN, &b);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
          dbus_int32_t i = v;
          AppendBasic(iter, DBUS_TYPE_INT32, &i);
        } else if constexpr (std::is_same_v<T, std::uint32_t>) {
          dbus_uint32_t u = v;
          AppendBasic(iter, DBUS_TYPE_UINT32, &u);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          dbus_int64_t x = v;
          AppendBasic(iter, DBUS_TYPE_INT64, &x);
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          dbus_uint64_t t = v;
          AppendBasic(iter, DBUS_TYPE_UINT64, &t);
        } else if constexpr (std::is_same_v<T, double>) {
          double d = v;
          AppendBasic(iter, DBUS_TYPE_DOUBLE, &d);
        } else if constexpr (std::is_same_v<T, std::string>) {
          const char* s = v.c_str();
          AppendBasic(iter, DBUS_TYPE_STRING, &s);
        } else if constexpr (std::is_same_v<T, ObjectPath>) {
          const char* o = v.path.c_str();
          AppendBasic(iter, DBUS_TYPE_OBJECT_PATH, &o);
        } else if constexpr (std::is_same_v<T, StringList>) {
          DBusMessageIter sub;
          if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, DBUS_TYPE_STRING_AS_STRING, &sub)) ThrowNoMemory();
          for (const auto& item : v) {
            const char* s = item.c_str();
            AppendBasic(&sub, DBUS_TYPE_STRING, &s);
          }
          if (!dbus_message_iter_close_container(iter, &sub)) ThrowNoMemory();
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const PropertyMap>>) {
          DBusMessageIter array;
          if (!dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &array)) ThrowNoMemory();
          if (v) {
            for (const auto& [key, entry_value] : *v) {
              DBusMessageIter entry;
              if (!dbus_message_iter_open_container(&array, DBUS_TYPE_DICT_ENTRY, nullptr, &entry)) ThrowNoMemory();
              const char* k = key.c_str();
              AppendBasic(&entry, DBUS_TYPE_STRING, &k);
              EncodeVariant(&entry, entry_value);
              if (!dbus_message_iter_close_container(&array, &entry)) ThrowNoMemory();
            }
          }
          if (!dbus_message_iter_close_container(iter, &array)) ThrowNoMemory();
        } else {
          if (!v.inner) throw BusError("org.freedesktop.DBus.Error.InvalidArgs", "empty variant");
          EncodeVariant(iter, *v.inner);
        }
      },
      value.data);
}

// ------------------------------------------------------------
// Decoding
// ------------------------------------------------------------

Value Decode(DBusMessageIter* iter);

Value DecodeArray(DBusMessageIter* iter) {
  const int       element = dbus_message_iter_get_element_type(iter);
  DBusMessageIter sub;
  dbus_message_iter_recurse(iter, &sub);

  if (element == DBUS_TYPE_STRING || element == DBUS_TYPE_OBJECT_PATH) {
    StringList list;
    while (dbus_message_iter_get_arg_type(&sub) != DBUS_TYPE_INVALID) {
      const char* s = nullptr;
      dbus_message_iter_get_basic(&sub, &s);
      list.emplace_back(s ? s : "");
      dbus_message_iter_next(&sub);
    }
    return Value(std::move(list));
  }

  if (element == DBUS_TYPE_DICT_ENTRY) {
    PropertyMap map;
    while (dbus_message_iter_get_arg_type(&sub) == DBUS_TYPE_DICT_ENTRY) {
      DBusMessageIter entry;
      dbus_message_iter_recurse(&sub, &entry);
      const int key_type = dbus_message_iter_get_arg_type(&entry);
      if (key_type == DBUS_TYPE_STRING || key_type == DBUS_TYPE_OBJECT_PATH) {
        const char* key = nullptr;
        dbus_message_iter_get_basic(&entry, &key);
        dbus_message_iter_next(&entry);
        map[key ? key : ""] = Decode(&entry);
      }
      dbus_message_iter_next(&sub);
    }
    return Value(std::move(map));
  }

  return Value();
}

Value Decode(DBusMessageIter* iter) {
  switch (dbus_message_iter_get_arg_type(iter)) {
    case DBUS_TYPE_BOOLEAN: {
      dbus_bool_t v = FALSE;
      dbus_message_iter_get_basic(iter, &v);
      return Value(v != FALSE);
    }
    case DBUS_TYPE_BYTE: {
      unsigned char v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::uint32_t>(v));
    }
    case DBUS_TYPE_INT16: {
      dbus_int16_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::int32_t>(v));
    }
    case DBUS_TYPE_UINT16: {
      dbus_uint16_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::uint32_t>(v));
    }
    case DBUS_TYPE_INT32: {
      dbus_int32_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::int32_t>(v));
    }
    case DBUS_TYPE_UINT32: {
      dbus_uint32_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::uint32_t>(v));
    }
    case DBUS_TYPE_INT64: {
      dbus_int64_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::int64_t>(v));
    }
    case DBUS_TYPE_UINT64: {
      dbus_uint64_t v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(static_cast<std::uint64_t>(v));
    }
    case DBUS_TYPE_DOUBLE: {
      double v = 0;
      dbus_message_iter_get_basic(iter, &v);
      return Value(v);
    }
    case DBUS_TYPE_STRING:
    case DBUS_TYPE_SIGNATURE: {
      const char* v = nullptr;
      dbus_message_iter_get_basic(iter, &v);
      return Value(std::string(v ? v : ""));
    }
    case DBUS_TYPE_OBJECT_PATH: {
      const char* v = nullptr;
      dbus_message_iter_get_basic(iter, &v);
      return Value(ObjectPath{v ? v : ""});
    }
    case DBUS_TYPE_VARIANT: {
      DBusMessageIter sub;
      dbus_message_iter_recurse(iter, &sub);
      return Decode(&sub);
    }
    case DBUS_TYPE_ARRAY:
      return DecodeArray(iter);
    default:
      return Value();
  }
}

std::vector<Value> DecodeArgs(DBusMessage* message) {
  std::vector<Value> args;
  DBusMessageIter    iter;
  if (!dbus_message_iter_init(message, &iter)) return args;
  while (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_INVALID) {
    args.push_back(Decode(&iter));
    dbus_message_iter_next(&iter);
  }
  return args;
}

MessagePtr BuildCall(const MethodCall& call) {
  MessagePtr message(dbus_message_new_method_call(call.destination.empty() ? nullptr : call.destination.c_str(),
                                                  call.path.c_str(),
                                                  call.interface.empty() ? nullptr : call.interface.c_str(),
                                                  call.member.c_str()));
  if (!message) ThrowNoMemory();

  DBusMessageIter iter;
  dbus_message_iter_init_append(message.get(), &iter);
  for (const auto& arg : call.args) {
    Encode(&iter, arg);
  }
  return message;
}

std::string MatchRule(const SignalMatch& match) {
  std::string rule = "type='signal'";
  auto        add  = [&rule](const char* key, const std::string& value) {
    if (!value.empty()) rule += std::string(",") + key + "='" + value + "'";
  };
  add("sender", match.sender);
  add("path", match.path);
  add("interface", match.interface);
  add("member", match.member);
  add("arg0namespace", match.arg0_namespace);
  return rule;
}

std::string Str(const char* s) {
  return s ? s : "";
}

} // namespace

// ------------------------------------------------------------
// DbusSessionBus
// ------------------------------------------------------------

std::shared_ptr<DbusSessionBus> DbusSessionBus::Connect() {
  if (!dbus_threads_init_default()) {
    throw BusError("org.freedesktop.DBus.Error.NoMemory", "failed to initialise libdbus threading");
  }

  ErrorGuard      err;
  DBusConnection* connection = dbus_bus_get_private(DBUS_BUS_SESSION, &err.error);
  if (err.IsSet()) err.Throw("connect to session bus");
  if (!connection) {
    throw BusError("org.freedesktop.DBus.Error.Failed", "connect to session bus: no connection");
  }

  dbus_connection_set_exit_on_disconnect(connection, FALSE);
  return std::make_shared<DbusSessionBus>(ConnectTag{}, connection);
}

DbusSessionBus::DbusSessionBus(ConnectTag, DBusConnection* connection) : connection_(connection) {
  unique_name_ = Str(dbus_bus_get_unique_name(connection_));

  if (!dbus_connection_add_filter(connection_, &DbusSessionBus::Filter, this, nullptr)) {
    dbus_connection_close(connection_);
    dbus_connection_unref(connection_);
    ThrowNoMemory();
  }

  dispatcher_ = std::thread([this] { DispatchLoop(); });

  MPRISRELAY_LOG_INFO("Connected to session bus", {observability::StringField("unique_name", unique_name_)});
}

DbusSessionBus::~DbusSessionBus() {
  Close();
}

void DbusSessionBus::Close() {
  running_ = false;
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  if (connection_) {
    dbus_connection_remove_filter(connection_, &DbusSessionBus::Filter, this);
    dbus_connection_close(connection_);
    dbus_connection_unref(connection_);
    connection_ = nullptr;
  }
  connected_ = false;
}

void DbusSessionBus::DispatchLoop() {
  while (running_) {
    if (!dbus_connection_read_write_dispatch(connection_, 100)) {
      NotifyDisconnected();
      return;
    }
  }
}

DBusHandlerResult DbusSessionBus::Filter(DBusConnection*, DBusMessage* message, void* self) {
  auto* bus = static_cast<DbusSessionBus*>(self);

  if (dbus_message_is_signal(message, DBUS_INTERFACE_LOCAL, "Disconnected")) {
    bus->NotifyDisconnected();
    return DBUS_HANDLER_RESULT_HANDLED;
  }

  if (dbus_message_get_type(message) != DBUS_MESSAGE_TYPE_SIGNAL) {
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
  }

  Signal signal;
  signal.sender    = Str(dbus_message_get_sender(message));
  signal.path      = Str(dbus_message_get_path(message));
  signal.interface = Str(dbus_message_get_interface(message));
  signal.member    = Str(dbus_message_get_member(message));
  signal.args      = DecodeArgs(message);

  bus->Deliver(signal);
  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void DbusSessionBus::Deliver(const Signal& signal) {
  std::vector<SignalHandler> handlers;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, sub] : subscriptions_) {
      if (Matches(sub.match, signal)) handlers.push_back(sub.handler);
    }
  }

  for (const auto& handler : handlers) {
    try {
      handler(signal);
    } catch (const std::exception& e) {
      MPRISRELAY_LOG_WARN("Signal handler failed", {observability::StringField("member", signal.member),
                                                    observability::StringField("error", e.what())});
    }
  }
}

void DbusSessionBus::NotifyDisconnected() {
  std::function<void()> handler;
  {
    std::lock_guard lock(mutex_);
    connected_ = false;
    if (disconnect_fired_) return;
    disconnect_fired_ = true;
    handler           = on_disconnect_;
  }

  MPRISRELAY_LOG_WARN("Session bus connection lost");
  if (handler) handler();
}

std::vector<Value> DbusSessionBus::Call(const MethodCall& call, std::chrono::milliseconds timeout) {
  if (!connected_) {
    throw BusError("org.freedesktop.DBus.Error.Disconnected", "session bus connection is closed");
  }

  auto       message = BuildCall(call);
  ErrorGuard err;
  MessagePtr reply(dbus_connection_send_with_reply_and_block(connection_, message.get(),
                                                             static_cast<int>(timeout.count()), &err.error));
  if (err.IsSet()) err.Throw(call.interface + "." + call.member + " on " + call.destination);
  if (!reply) {
    throw BusError("org.freedesktop.DBus.Error.NoReply", call.member + " returned no reply");
  }
  return DecodeArgs(reply.get());
}

void DbusSessionBus::Send(const MethodCall& call) {
  if (!connected_) return;

  auto message = BuildCall(call);
  dbus_message_set_no_reply(message.get(), TRUE);
  if (!dbus_connection_send(connection_, message.get(), nullptr)) {
    MPRISRELAY_LOG_WARN("Dropped outgoing bus message", {observability::StringField("member", call.member)});
    return;
  }
  dbus_connection_flush(connection_);
}

Bus::SubscriptionId DbusSessionBus::Subscribe(const SignalMatch& match, SignalHandler handler) {
  const auto rule = MatchRule(match);

  ErrorGuard err;
  dbus_bus_add_match(connection_, rule.c_str(), &err.error);
  if (err.IsSet()) err.Throw("add match " + rule);

  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.emplace(id, Subscription{match, rule, std::move(handler)});
  return id;
}

void DbusSessionBus::Unsubscribe(SubscriptionId id) {
  std::string rule;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscriptions_.find(id);
    if (it == subscriptions_.end()) return;
    rule = it->second.rule;
    subscriptions_.erase(it);
  }
  if (connected_) {
    // Without an error object libdbus does not wait for the reply.
    dbus_bus_remove_match(connection_, rule.c_str(), nullptr);
  }
}

void DbusSessionBus::SetDisconnectHandler(std::function<void()> handler) {
  std::lock_guard lock(mutex_);
  on_disconnect_ = std::move(handler);
}

bool DbusSessionBus::IsConnected() const {
  return connected_;
}

} // namespace mprisrelay::bus
