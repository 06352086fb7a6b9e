#ifndef CONCORD_DECODER_H
#define CONCORD_DECODER_H

/*----- Local Includes -----*/

#include "cursor.h"
#include "value.h"

/*----- Function Declarations -----*/

namespace concord {

  struct decoded_value {
    value val;
    mark start;
  };

  /**
   *  @brief
   *  Consumes one value-shaped construct (scalar, sequence or mapping).
   *
   *  @details
   *  Quoted and block scalars are always strings. Plain scalars are tried,
   *  in order, as a float (kept as text), a 64-bit integer, the literals
   *  true/false, and finally fall back to a string.
   */
  decoded_value decode_value(cursor& in);

  // Consumes a scalar key and its value, decoding the value under the
  // breadcrumb "'<key>'".
  kv decode_kv(cursor& in);

  // Coercion applied to a single scalar.
  value decode_scalar(std::string text, scalar_style style);

  // Extended float grammar: decimal floats plus the .inf/.nan spellings.
  bool is_float_literal(shim::string_view text) noexcept;

  shim::optional<int64_t> parse_integer(shim::string_view text) noexcept;

}

#endif
