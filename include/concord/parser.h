#ifndef CONCORD_PARSER_H
#define CONCORD_PARSER_H

/*----- System Includes -----*/

#include <string>
#include <vector>

/*----- Local Includes -----*/

#include "model.h"
#include "cursor.h"

/*----- Function Declarations -----*/

namespace concord {

  /**
   *  @brief
   *  Parses a whole event stream into one document per YAML document.
   *
   *  @details
   *  Expects stream start, then documents until stream end. The first
   *  error aborts the whole call, there is no partial result.
   */
  std::vector<document> parse_stream(cursor& in);

  // Convenience overload scanning the text with libyaml.
  std::vector<document> parse_stream(std::string yaml);

  /**
   *  @brief
   *  Parses a single document: document start, one top-level mapping of
   *  configuration/flows/forms/publicFlows, document end.
   */
  document parse_document(cursor& in);

  // Parses a sequence of one or more steps.
  step_list parse_steps(cursor& in);

  // Parses a single step mapping.
  step parse_step(cursor& in);

}

#endif
