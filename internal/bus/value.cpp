#include "internal/bus/value.hpp"

#include <cmath>

namespace mprisrelay::bus {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const Value& Unwrap(const Value& value) {
  const Value* current = &value;
  while (auto* v = std::get_if<Variant>(&current->data)) {
    if (!v->inner) break;
    current = v->inner.get();
  }
  return *current;
}

} // namespace

Value WrapVariant(Value inner) {
  return Value(Variant{std::make_shared<const Value>(std::move(inner))});
}

std::optional<bool> AsBool(const Value& value) {
  const auto& v = Unwrap(value);
  if (auto* b = std::get_if<bool>(&v.data)) return *b;
  return std::nullopt;
}

std::optional<std::int64_t> AsInt64(const Value& value) {
  const auto& v = Unwrap(value);
  return std::visit(Overloaded{
                        [](std::int32_t x) -> std::optional<std::int64_t> { return x; },
                        [](std::uint32_t x) -> std::optional<std::int64_t> { return x; },
                        [](std::int64_t x) -> std::optional<std::int64_t> { return x; },
                        [](std::uint64_t x) -> std::optional<std::int64_t> { return static_cast<std::int64_t>(x); },
                        [](double x) -> std::optional<std::int64_t> {
                          if (!std::isfinite(x) || std::trunc(x) != x) return std::nullopt;
                          return static_cast<std::int64_t>(x);
                        },
                        [](const auto&) -> std::optional<std::int64_t> { return std::nullopt; },
                    },
                    v.data);
}

std::optional<double> AsDouble(const Value& value) {
  const auto& v = Unwrap(value);
  if (auto* d = std::get_if<double>(&v.data)) return *d;
  if (auto i = AsInt64(v)) return static_cast<double>(*i);
  return std::nullopt;
}

std::optional<std::string> AsString(const Value& value) {
  const auto& v = Unwrap(value);
  if (auto* s = std::get_if<std::string>(&v.data)) return *s;
  if (auto* p = std::get_if<ObjectPath>(&v.data)) return p->path;
  return std::nullopt;
}

std::optional<StringList> AsStringList(const Value& value) {
  const auto& v = Unwrap(value);
  if (auto* list = std::get_if<StringList>(&v.data)) return *list;
  if (auto s = AsString(v)) return StringList{*s};
  return std::nullopt;
}

const PropertyMap* AsMap(const Value& value) {
  const auto& v = Unwrap(value);
  if (auto* map = std::get_if<std::shared_ptr<const PropertyMap>>(&v.data)) return map->get();
  return nullptr;
}

const Value* Find(const PropertyMap& map, const std::string& key) {
  auto it = map.find(key);
  return it == map.end() ? nullptr : &it->second;
}

} // namespace mprisrelay::bus
