/*----- System Includes -----*/

#include <sstream>

/*----- Local Includes -----*/

#include "../include/concord/common.h"

/*----- Function Implementations -----*/

namespace concord {

  namespace {

    std::string format_error(error_kind kind, std::string const& msg, shim::optional<location> const& where) {
      std::ostringstream out;
      out << kind;
      if (where) out << " @ " << *where;
      out << ": " << msg;
      return out.str();
    }

  }

  parse_error::parse_error(error_kind kind, std::string msg, shim::optional<location> where) :
    runtime_error(format_error(kind, msg, where)),
    err_kind(kind),
    msg(std::move(msg)),
    loc(std::move(where))
  {}

  std::string to_string(document_path const& path) {
    std::string joined;
    for (auto const& label : path) {
      if (!joined.empty()) joined += "->";
      joined += label;
    }
    return joined;
  }

  std::string to_string(location const& loc) {
    std::ostringstream out;
    out << loc;
    return out.str();
  }

  char const* to_string(error_kind kind) noexcept {
    switch (kind) {
      case error_kind::scan_error:
        return "scan error";
      case error_kind::unexpected_syntax:
        return "unexpected syntax";
    }
    return "unknown error";
  }

  std::ostream& operator <<(std::ostream& out, location const& loc) {
    if (!loc.path.empty()) out << to_string(loc.path) << ' ';
    return out << "(line " << loc.line << ", column " << loc.column << ')';
  }

  std::ostream& operator <<(std::ostream& out, error_kind kind) {
    return out << to_string(kind);
  }

  std::ostream& operator <<(std::ostream& out, parse_error const& err) {
    return out << err.what();
  }

}
