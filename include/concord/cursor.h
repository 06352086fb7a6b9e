#ifndef CONCORD_CURSOR_H
#define CONCORD_CURSOR_H

/*----- System Includes -----*/

#include <string>
#include <gsl/gsl>
#include <functional>

/*----- Local Includes -----*/

#include "event.h"

/*----- Type Declarations -----*/

namespace concord {

  /**
   *  @brief
   *  One-event lookahead over an event_source, plus the breadcrumb stack
   *  used for diagnostics.
   *
   *  @details
   *  A cursor is owned by exactly one in-flight parse. It never rewinds
   *  further than the single buffered event.
   *  Every "expect" operation throws parse_error(unexpected_syntax) with the
   *  current breadcrumb path on mismatch.
   */
  class cursor {

    public:

      /*----- Public Types -----*/

      using context_guard = gsl::final_action<std::function<void ()>>;

      /*----- Lifecycle Functions -----*/

      explicit cursor(event_source& src) : src(&src), finished(false) {}
      cursor(cursor const&) = delete;
      ~cursor() = default;

      /*----- Operators -----*/

      cursor& operator =(cursor const&) = delete;

      /*----- Event Access -----*/

      event next();
      event const& peek();

      // True if the next event is of the given type. Only scan failures throw.
      bool at(event_type type);

      event expect(event_type type);
      event expect_scalar();
      event expect_scalar_equal(shim::string_view literal);

      // Raw text of the upcoming scalar without consuming it. A non-scalar
      // where a keyword was expected is itself a syntax error.
      std::string const& peek_scalar();

      /*----- Breadcrumbs -----*/

      void push_context(std::string label);
      void pop_context();

      // Pushes the label and returns a guard popping it on scope exit.
      CONCORD_NODISCARD context_guard enter(std::string label);

      document_path const& current_path() const noexcept {
        return path;
      }

      std::size_t depth() const noexcept {
        return path.size();
      }

      location locate(mark const& where) const;

      /*----- Diagnostics -----*/

      [[noreturn]] void fail(mark const& where, std::string msg) const;
      [[noreturn]] void fail(location where, std::string msg) const;

    private:

      /*----- Private Helpers -----*/

      event pull();

      /*----- Private Members -----*/

      gsl::not_null<event_source*> src;
      shim::optional<event> lookahead;
      document_path path;
      bool finished;

  };

}

#endif
