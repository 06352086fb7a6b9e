#ifndef CONCORD_JSON_H
#define CONCORD_JSON_H
#if CONCORD_HAS_RAPIDJSON

/*----- System Includes -----*/

#include <string>
#include <vector>

/*----- Local Includes -----*/

#include "model.h"

/*----- Function Declarations -----*/

namespace concord {

  /**
   *  @brief
   *  Renders parsed documents as JSON for inspection.
   *
   *  @details
   *  Steps are objects carrying a "kind" discriminator. Floats are written as
   *  strings holding their original text, mappings as objects in source order
   *  with duplicate keys preserved. Locations are included when with_locations
   *  is set.
   */
  std::string to_json(document const& doc, bool with_locations = false);
  std::string to_json(std::vector<document> const& docs, bool with_locations = false);
  std::string to_json(value const& val);

}

#endif
#endif
