/*----- Local Includes -----*/

#include "../include/concord/cursor.h"

/*----- Function Implementations -----*/

namespace concord {

  event cursor::next() {
    if (lookahead) {
      event ev = std::move(*lookahead);
      lookahead.reset();
      if (ev.is(event_type::stream_end)) finished = true;
      return ev;
    }
    event ev = pull();
    if (ev.is(event_type::stream_end)) finished = true;
    return ev;
  }

  event const& cursor::peek() {
    if (!lookahead) lookahead = pull();
    return *lookahead;
  }

  bool cursor::at(event_type type) {
    return peek().is(type);
  }

  event cursor::expect(event_type type) {
    event ev = next();
    if (!ev.is(type)) {
      fail(ev.start, std::string {"Expected "} + to_string(type) + ", got " + describe(ev));
    }
    return ev;
  }

  event cursor::expect_scalar() {
    event ev = next();
    if (!ev.is(event_type::scalar)) fail(ev.start, "Expected a string value, got " + describe(ev));
    return ev;
  }

  event cursor::expect_scalar_equal(shim::string_view literal) {
    event ev = expect_scalar();
    if (ev.text != literal) {
      fail(ev.start, "Expected '" + std::string {literal} + "', got " + describe(ev));
    }
    return ev;
  }

  std::string const& cursor::peek_scalar() {
    auto& ev = peek();
    if (!ev.is(event_type::scalar)) fail(ev.start, "Expected to peek a scalar, got " + describe(ev));
    return ev.text;
  }

  void cursor::push_context(std::string label) {
    path.push_back(std::move(label));
  }

  void cursor::pop_context() {
    Expects(!path.empty());
    path.pop_back();
  }

  auto cursor::enter(std::string label) -> context_guard {
    push_context(std::move(label));
    return gsl::finally(std::function<void ()> {[this] { pop_context(); }});
  }

  location cursor::locate(mark const& where) const {
    return location {path, where};
  }

  void cursor::fail(mark const& where, std::string msg) const {
    throw parse_error(error_kind::unexpected_syntax, std::move(msg), locate(where));
  }

  void cursor::fail(location where, std::string msg) const {
    throw parse_error(error_kind::unexpected_syntax, std::move(msg), std::move(where));
  }

  event cursor::pull() {
    if (finished) throw parse_error(error_kind::scan_error, "EOF");
    try {
      return src->next();
    } catch (parse_error const& err) {
      // Sources don't know where the grammar is, attach the breadcrumbs.
      if (!err.where()) throw;
      throw parse_error(err.kind(), err.message(), locate(mark {err.where()->index,
            err.where()->line, err.where()->column}));
    }
  }

}
