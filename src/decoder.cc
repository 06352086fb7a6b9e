/*----- System Includes -----*/

#include <cctype>
#include <cerrno>
#include <cstdlib>

/*----- Local Includes -----*/

#include "../include/concord/decoder.h"

/*----- Function Implementations -----*/

namespace concord {

  namespace {

    bool is_digit(char c) noexcept {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // Skips a run of digits, returning how many there were.
    std::size_t skip_digits(shim::string_view text, std::size_t& pos) noexcept {
      auto begin = pos;
      while (pos < text.size() && is_digit(text[pos])) ++pos;
      return pos - begin;
    }

  }

  bool is_float_literal(shim::string_view text) noexcept {
    static constexpr shim::string_view specials[] = {
      ".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF",
      "-.inf", "-.Inf", "-.INF", ".nan", ".NaN", ".NAN", "NaN"
    };
    for (auto special : specials) {
      if (text == special) return true;
    }

    // [+-]? (digits '.' digits? | '.' digits) ([eE] [+-]? digits)?
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
    auto integral = skip_digits(text, pos);
    if (pos == text.size() || text[pos] != '.') return false;
    ++pos;
    auto fractional = skip_digits(text, pos);
    if (!integral && !fractional) return false;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
      ++pos;
      if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
      if (!skip_digits(text, pos)) return false;
    }
    return pos == text.size();
  }

  shim::optional<int64_t> parse_integer(shim::string_view text) noexcept {
    // Only an optional sign followed by decimal digits, no whitespace or prefixes.
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
    if (!skip_digits(text, pos) || pos != text.size()) return shim::nullopt;

    std::string buf {text};
    errno = 0;
    char* problem;
    long long val = strtoll(buf.c_str(), &problem, 10);
    if (errno || problem != buf.c_str() + buf.size()) return shim::nullopt;
    return static_cast<int64_t>(val);
  }

  value decode_scalar(std::string text, scalar_style style) {
    switch (style) {
      case scalar_style::single_quoted:
      case scalar_style::double_quoted:
      case scalar_style::literal:
      case scalar_style::folded:
        return value::make_string(std::move(text));
      case scalar_style::plain:
        break;
    }

    if (text.find('.') != std::string::npos && is_float_literal(text)) {
      return value::make_decimal(std::move(text));
    } else if (auto integer = parse_integer(text)) {
      return value::make_integer(*integer);
    } else if (text == "true") {
      return value::make_boolean(true);
    } else if (text == "false") {
      return value::make_boolean(false);
    }
    return value::make_string(std::move(text));
  }

  decoded_value decode_value(cursor& in) {
    event ev = in.next();
    switch (ev.type) {
      case event_type::scalar:
        return decoded_value {decode_scalar(std::move(ev.text), ev.style), ev.start};
      case event_type::sequence_start:
        {
          value::array_type elems;
          while (!in.at(event_type::sequence_end)) {
            elems.push_back(decode_value(in).val);
          }
          in.expect(event_type::sequence_end);
          return decoded_value {value::make_array(std::move(elems)), ev.start};
        }
      case event_type::mapping_start:
        {
          value::mapping_type entries;
          while (!in.at(event_type::mapping_end)) {
            entries.push_back(decode_kv(in));
          }
          in.expect(event_type::mapping_end);
          return decoded_value {value::make_mapping(std::move(entries)), ev.start};
        }
      default:
        in.fail(ev.start, "Expected a value, got " + describe(ev));
    }
  }

  kv decode_kv(cursor& in) {
    event key = in.expect_scalar();
    value val;
    {
      auto guard = in.enter("'" + key.text + "'");
      val = decode_value(in).val;
    }
    return kv {in.locate(key.start), std::move(key.text), std::move(val)};
  }

}
