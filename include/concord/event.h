#ifndef CONCORD_EVENT_H
#define CONCORD_EVENT_H

/*----- System Includes -----*/

#include <memory>
#include <string>
#include <vector>
#include <ostream>

/*----- Local Includes -----*/

#include "common.h"

/*----- Type Declarations -----*/

// Avoid pulling libyaml into every translation unit.
struct yaml_parser_s;

namespace concord {

  enum class event_type {
    stream_start,
    stream_end,
    document_start,
    document_end,
    mapping_start,
    mapping_end,
    sequence_start,
    sequence_end,
    scalar
  };

  enum class scalar_style {
    plain,
    single_quoted,
    double_quoted,
    literal,
    folded
  };

  /**
   *  @brief
   *  One structural event of a YAML stream.
   *
   *  @details
   *  text and style are only meaningful for scalars.
   */
  struct event {

    /*----- Factories -----*/

    static event make(event_type type, mark start = {});
    static event make_scalar(std::string text, scalar_style style = scalar_style::plain, mark start = {});

    /*----- Public API -----*/

    bool is(event_type other) const noexcept {
      return type == other;
    }

    /*----- Members -----*/

    event_type type {event_type::stream_start};
    std::string text;
    scalar_style style {scalar_style::plain};
    mark start;

  };

  /**
   *  @brief
   *  Producer of the ordered event sequence the grammar consumes.
   *
   *  @details
   *  Implementations throw parse_error with error_kind::scan_error when the
   *  underlying text is malformed or when they have nothing left to give,
   *  and with error_kind::unexpected_syntax for well formed YAML the
   *  grammar can never accept (aliases).
   */
  class event_source {

    public:

      /*----- Lifecycle Functions -----*/

      event_source() = default;
      event_source(event_source const&) = delete;
      virtual ~event_source() = default;

      /*----- Operators -----*/

      event_source& operator =(event_source const&) = delete;

      /*----- Public API -----*/

      virtual event next() = 0;

  };

  /**
   *  @brief
   *  event_source backed by libyaml.
   *
   *  @details
   *  Owns a copy of the input text for as long as the parser needs it.
   *  Alias events are rejected as unexpected syntax, tags and anchors are
   *  ignored.
   */
  class yaml_source final : public event_source {

    public:

      /*----- Lifecycle Functions -----*/

      explicit yaml_source(std::string yaml);
      yaml_source(yaml_source&&) = delete;
      ~yaml_source() override;

      /*----- Public API -----*/

      event next() override;

    private:

      /*----- Private Members -----*/

      std::string input;
      std::unique_ptr<yaml_parser_s> parser;
      bool exhausted;

  };

  /**
   *  @brief
   *  event_source replaying an already produced event list.
   *
   *  @details
   *  Lets events from another scanner drive the grammar, and lets tests
   *  feed exact event shapes.
   */
  class replay_source final : public event_source {

    public:

      /*----- Lifecycle Functions -----*/

      explicit replay_source(std::vector<event> events) : events(std::move(events)), idx(0) {}

      /*----- Public API -----*/

      event next() override;

    private:

      /*----- Private Members -----*/

      std::vector<event> events;
      std::size_t idx;

  };

  /*----- Free Functions -----*/

  char const* to_string(event_type type) noexcept;

  // Short description used in diagnostics, e.g. "scalar 'foo'" or "mapping end".
  std::string describe(event const& ev);

  std::ostream& operator <<(std::ostream& out, event_type type);

}

#endif
