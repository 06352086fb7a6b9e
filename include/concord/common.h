#ifndef CONCORD_COMMON_H
#define CONCORD_COMMON_H

/*----- System Includes -----*/

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <stdexcept>

/*----- Local Includes -----*/

#include "shim.h"

/*----- Global Declarations -----*/

namespace concord {

  /**
   *  @brief
   *  Diagnostic breadcrumbs describing where the parser currently is.
   *
   *  @details
   *  Each entry is a human readable label ("document", "'flows'", "step 3"...).
   *  The path only ever feeds error messages, nothing in the grammar
   *  depends on it.
   */
  using document_path = std::vector<std::string>;

  /**
   *  @brief
   *  Raw position of an event in the input text.
   *
   *  @details
   *  index is a byte offset, line is 1 based, column is 0 based.
   */
  struct mark {
    std::size_t index {0};
    std::size_t line {0};
    std::size_t column {0};
  };

  struct location {

    /*----- Lifecycle Functions -----*/

    location() = default;
    location(document_path path, mark const& where) :
      path(std::move(path)),
      index(where.index),
      line(where.line),
      column(where.column)
    {}
    location(location const&) = default;
    location(location&&) = default;
    ~location() = default;

    /*----- Operators -----*/

    location& operator =(location const&) = default;
    location& operator =(location&&) = default;

    /*----- Members -----*/

    document_path path;
    std::size_t index {0};
    std::size_t line {0};
    std::size_t column {0};

  };

  enum class error_kind {
    scan_error,
    unexpected_syntax
  };

  struct type_error : std::logic_error {
    type_error(char const* msg) : logic_error(msg) {}
  };

  /**
   *  @brief
   *  The one exception type thrown out of a parse.
   *
   *  @details
   *  Every failure is fatal to the parse that raised it. The location is
   *  empty only when the failure happened outside of any position, for
   *  example when events are requested past the end of the stream.
   */
  class parse_error : public std::runtime_error {

    public:

      /*----- Lifecycle Functions -----*/

      parse_error(error_kind kind, std::string msg, shim::optional<location> where = shim::nullopt);
      parse_error(parse_error const&) = default;
      parse_error(parse_error&&) = default;
      ~parse_error() override = default;

      /*----- Public API -----*/

      error_kind kind() const noexcept {
        return err_kind;
      }

      std::string const& message() const noexcept {
        return msg;
      }

      shim::optional<location> const& where() const noexcept {
        return loc;
      }

    private:

      /*----- Private Members -----*/

      error_kind err_kind;
      std::string msg;
      shim::optional<location> loc;

  };

  /*----- Free Functions -----*/

  std::string to_string(document_path const& path);
  std::string to_string(location const& loc);
  char const* to_string(error_kind kind) noexcept;

  std::ostream& operator <<(std::ostream& out, location const& loc);
  std::ostream& operator <<(std::ostream& out, error_kind kind);
  std::ostream& operator <<(std::ostream& out, parse_error const& err);

}

#endif
