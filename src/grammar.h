#ifndef CONCORD_GRAMMAR_H
#define CONCORD_GRAMMAR_H

/*----- System Includes -----*/

#include <string>
#include <vector>
#include <utility>

/*----- Local Includes -----*/

#include "../include/concord/parser.h"
#include "../include/concord/decoder.h"

/*----- Helpers -----*/

namespace concord {
  namespace detail {

    /**
     *  @brief
     *  Parses one or more items until the given end marker is next.
     *
     *  @details
     *  The first item is always parsed before looking for the end marker, so
     *  an immediately closed collection fails inside the item parser. The end
     *  marker itself is left for the caller to consume.
     */
    template <class Parser>
    auto parse_until(cursor& in, event_type end, Parser&& parse_item) {
      std::vector<decltype(parse_item(in))> items;
      do {
        items.push_back(parse_item(in));
      } while (!in.at(end));
      return items;
    }

    /**
     *  @brief
     *  Loops over the remaining keys of the current mapping, handing each to
     *  the given handler until the mapping end is next.
     *
     *  @details
     *  "name" is accepted anywhere and stored in step_name. The handler
     *  returns false for keys it does not know, which is a syntax error
     *  reported against where.
     */
    template <class Handler>
    void parse_modifiers(cursor& in, shim::optional<std::string>& step_name,
        location const& where, char const* construct, Handler&& handle) {
      while (!in.at(event_type::mapping_end)) {
        auto element = in.peek_scalar();
        in.next();
        if (element == "name") {
          step_name = in.expect_scalar().text;
        } else if (!handle(element)) {
          in.fail(where, "Unexpected " + std::string {construct} + " element '" + element + "'");
        }
      }
    }

    // Runs the parser under the given breadcrumb.
    template <class Parser>
    auto with_context(cursor& in, std::string label, Parser&& parse) {
      auto guard = in.enter(std::move(label));
      return parse(in);
    }

    inline value parse_value(cursor& in) {
      return decode_value(in).val;
    }

    inline std::string parse_string(cursor& in) {
      return in.expect_scalar().text;
    }

    bool parse_bool(cursor& in);

    // Mapping of one or more key/value pairs.
    kv_list parse_kv_list(cursor& in);

    // Sequence of single-key mappings, field name to its options.
    std::vector<form_field> parse_form_fields(cursor& in);

    inline kv_list parse_meta(cursor& in) {
      return parse_kv_list(in);
    }

  }
}

#endif
