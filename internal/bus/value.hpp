#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mprisrelay::bus {

/*
  Bus values.

  A small, owned mirror of the object-bus type system covering what
  media players publish: scalars, strings, object paths, string arrays
  and string-keyed dictionaries (a{sv}). Variants are unwrapped on
  decode; Variant exists only so callers can request an explicit `v`
  when encoding (Properties.Set).
*/

struct ObjectPath {
  std::string path;

  bool operator==(const ObjectPath&) const = default;
};

struct Value;

using PropertyMap = std::map<std::string, Value>;
using StringList  = std::vector<std::string>;

struct Variant {
  std::shared_ptr<const Value> inner;
};

struct Value {
  using Storage = std::variant<std::monostate, bool, std::int32_t, std::uint32_t, std::int64_t, std::uint64_t, double,
                               std::string, ObjectPath, StringList, std::shared_ptr<const PropertyMap>, Variant>;

  Storage data;

  Value() = default;
  Value(bool v) : data(v) {
  }
  Value(std::int32_t v) : data(v) {
  }
  Value(std::uint32_t v) : data(v) {
  }
  Value(std::int64_t v) : data(v) {
  }
  Value(std::uint64_t v) : data(v) {
  }
  Value(double v) : data(v) {
  }
  Value(std::string v) : data(std::move(v)) {
  }
  Value(const char* v) : data(std::string(v)) {
  }
  Value(ObjectPath v) : data(std::move(v)) {
  }
  Value(StringList v) : data(std::move(v)) {
  }
  Value(PropertyMap v) : data(std::make_shared<const PropertyMap>(std::move(v))) {
  }
  Value(Variant v) : data(std::move(v)) {
  }

  bool IsNull() const {
    return std::holds_alternative<std::monostate>(data);
  }
};

Value WrapVariant(Value inner);

std::optional<bool>        AsBool(const Value& value);
// Any integer, or a double with no fractional part.
std::optional<std::int64_t> AsInt64(const Value& value);
std::optional<double>      AsDouble(const Value& value);
// Strings and object paths.
std::optional<std::string> AsString(const Value& value);
// String arrays; a lone string becomes a one-element list.
std::optional<StringList>  AsStringList(const Value& value);
const PropertyMap*         AsMap(const Value& value);

// Lookup helpers that treat a missing key like a wrong type.
const Value* Find(const PropertyMap& map, const std::string& key);

} // namespace mprisrelay::bus
