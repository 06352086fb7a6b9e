/*----- System Includes -----*/

#include <sstream>

/*----- Local Includes -----*/

#include "../include/concord/value.h"

/*----- Function Implementations -----*/

namespace concord {

  namespace {

    template <class T>
    T const& checked_get(shim::variant<std::string, bool, decimal_text, int64_t,
        value::array_type, value::mapping_type> const& data, char const* msg) {
      auto* ptr = shim::get_if<T>(&data);
      if (!ptr) throw type_error(msg);
      return *ptr;
    }

    void render(std::ostream& out, value const& val) {
      switch (val.get_type()) {
        case value::type::string:
          out << '"' << val.str() << '"';
          break;
        case value::type::boolean:
          out << (val.boolean() ? "true" : "false");
          break;
        case value::type::decimal:
          out << val.decimal();
          break;
        case value::type::integer:
          out << val.integer();
          break;
        case value::type::array:
          {
            out << '[';
            bool first = true;
            for (auto const& elem : val.array()) {
              if (!first) out << ", ";
              render(out, elem);
              first = false;
            }
            out << ']';
          }
          break;
        case value::type::mapping:
          {
            out << '{';
            bool first = true;
            for (auto const& entry : val.mapping()) {
              if (!first) out << ", ";
              out << entry.key << ": ";
              render(out, entry.val);
              first = false;
            }
            out << '}';
          }
          break;
      }
    }

  }

  value::value() : data(std::string {}) {}

  value::value(storage data) : data(std::move(data)) {}

  bool value::operator ==(value const& other) const {
    if (data.index() != other.data.index()) return false;
    switch (get_type()) {
      case type::string:
        return str() == other.str();
      case type::boolean:
        return boolean() == other.boolean();
      case type::decimal:
        // Floats compare by their text, "1.0" and "1.00" are different values.
        return decimal() == other.decimal();
      case type::integer:
        return integer() == other.integer();
      case type::array:
        return array() == other.array();
      case type::mapping:
        return mapping() == other.mapping();
    }
    return false;
  }

  bool value::operator !=(value const& other) const {
    return !(*this == other);
  }

  value value::make_string(std::string val) {
    return value {storage {std::move(val)}};
  }

  value value::make_boolean(bool val) {
    return value {storage {val}};
  }

  value value::make_decimal(std::string text) {
    return value {storage {decimal_text {std::move(text)}}};
  }

  value value::make_integer(int64_t val) {
    return value {storage {val}};
  }

  value value::make_array(array_type vals) {
    return value {storage {std::move(vals)}};
  }

  value value::make_mapping(mapping_type vals) {
    return value {storage {std::move(vals)}};
  }

  auto value::get_type() const noexcept -> type {
    return shim::visit(shim::compose_together(
      [] (std::string const&) { return type::string; },
      [] (bool) { return type::boolean; },
      [] (decimal_text const&) { return type::decimal; },
      [] (int64_t) { return type::integer; },
      [] (array_type const&) { return type::array; },
      [] (mapping_type const&) { return type::mapping; }
    ), data);
  }

  bool value::is_str() const noexcept {
    return shim::holds_alternative<std::string>(data);
  }

  bool value::is_boolean() const noexcept {
    return shim::holds_alternative<bool>(data);
  }

  bool value::is_decimal() const noexcept {
    return shim::holds_alternative<decimal_text>(data);
  }

  bool value::is_integer() const noexcept {
    return shim::holds_alternative<int64_t>(data);
  }

  bool value::is_array() const noexcept {
    return shim::holds_alternative<array_type>(data);
  }

  bool value::is_mapping() const noexcept {
    return shim::holds_alternative<mapping_type>(data);
  }

  std::string const& value::str() const {
    return checked_get<std::string>(data, "concord::value is not a string");
  }

  bool value::boolean() const {
    return checked_get<bool>(data, "concord::value is not a boolean");
  }

  std::string const& value::decimal() const {
    return checked_get<decimal_text>(data, "concord::value is not a decimal").text;
  }

  int64_t value::integer() const {
    return checked_get<int64_t>(data, "concord::value is not an integer");
  }

  auto value::array() const -> array_type const& {
    return checked_get<array_type>(data, "concord::value is not an array");
  }

  auto value::mapping() const -> mapping_type const& {
    return checked_get<mapping_type>(data, "concord::value is not a mapping");
  }

  auto value::array() -> array_type& {
    return const_cast<array_type&>(static_cast<value const&>(*this).array());
  }

  auto value::mapping() -> mapping_type& {
    return const_cast<mapping_type&>(static_cast<value const&>(*this).mapping());
  }

  std::size_t value::size() const noexcept {
    if (auto* arr = shim::get_if<array_type>(&data)) return arr->size();
    else if (auto* map = shim::get_if<mapping_type>(&data)) return map->size();
    else return 0;
  }

  value const& value::operator [](shim::string_view key) const {
    for (auto const& entry : mapping()) {
      if (entry.key == key) return entry.val;
    }
    throw std::out_of_range("concord::value has no such key: " + std::string {key});
  }

  value const& value::operator [](std::size_t idx) const {
    return array().at(idx);
  }

  bool operator ==(kv const& lhs, kv const& rhs) {
    // Locations are diagnostics, not content.
    return lhs.key == rhs.key && lhs.val == rhs.val;
  }

  bool operator !=(kv const& lhs, kv const& rhs) {
    return !(lhs == rhs);
  }

  char const* to_string(value::type type) noexcept {
    switch (type) {
      case value::type::string:
        return "string";
      case value::type::boolean:
        return "boolean";
      case value::type::decimal:
        return "decimal";
      case value::type::integer:
        return "integer";
      case value::type::array:
        return "array";
      case value::type::mapping:
        return "mapping";
    }
    return "unknown";
  }

  std::string to_string(value const& val) {
    std::ostringstream out;
    render(out, val);
    return out.str();
  }

  std::ostream& operator <<(std::ostream& out, value const& val) {
    render(out, val);
    return out;
  }

}
