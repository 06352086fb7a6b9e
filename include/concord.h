/**
 *  @file
 *  concord.h
 *
 *  @brief
 *  Contains all public declarations for the Concord flow definition parser.
 *
 *  @details
 *  Concord process definitions are YAML documents describing flows of steps,
 *  nested control constructs, forms and configuration. libconcord pulls the
 *  structural events of such a document (from libyaml, or any other
 *  event_source) through a one-event lookahead cursor and builds a strongly
 *  typed tree out of them, tagging every node with its source location and a
 *  human readable breadcrumb path for diagnostics.
 *  The library stops at syntax. What a task call or a loop means at runtime
 *  is up to whatever executes the tree.
 */

#ifndef CONCORD_H
#define CONCORD_H

// Check to make sure we have at least c++17.
#if __cplusplus < 201703L
static_assert(false, "libconcord requires a c++17 enabled compiler.");
#endif

/*----- Local Includes -----*/

#include "concord/shim.h"
#include "concord/common.h"
#include "concord/value.h"
#include "concord/model.h"
#include "concord/event.h"
#include "concord/cursor.h"
#include "concord/decoder.h"
#include "concord/parser.h"
#include "concord/json.h"

/*----- Macro Definitions -----*/

// Version macros for conditional compilation/feature checks.
#define CONCORD_MAJOR_VERSION          0
#define CONCORD_MINOR_VERSION          1
#define CONCORD_PATCH_VERSION          0

#endif
