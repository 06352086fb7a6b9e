/*----- System Includes -----*/

#include <yaml.h>
#include <algorithm>
#include <gsl/gsl>

/*----- Local Includes -----*/

#include "../include/concord/event.h"

/*----- Function Implementations -----*/

namespace concord {

  namespace {

    mark convert_mark(yaml_mark_t const& src) {
      // libyaml counts lines from zero.
      return mark {src.index, src.line + 1, src.column};
    }

    // Reader errors only carry a byte offset, recover the line and column from the text.
    mark mark_at_offset(std::string const& text, std::size_t offset) {
      offset = std::min(offset, text.size());
      mark where {offset, 1, 0};
      std::size_t line_start = 0;
      for (std::size_t idx = 0; idx < offset; ++idx) {
        if (text[idx] != '\n') continue;
        ++where.line;
        line_start = idx + 1;
      }
      where.column = offset - line_start;
      return where;
    }

    scalar_style convert_style(yaml_scalar_style_t style) {
      switch (style) {
        case YAML_SINGLE_QUOTED_SCALAR_STYLE:
          return scalar_style::single_quoted;
        case YAML_DOUBLE_QUOTED_SCALAR_STYLE:
          return scalar_style::double_quoted;
        case YAML_LITERAL_SCALAR_STYLE:
          return scalar_style::literal;
        case YAML_FOLDED_SCALAR_STYLE:
          return scalar_style::folded;
        default:
          return scalar_style::plain;
      }
    }

    [[noreturn]] void scan_failure(std::string msg, mark const& where) {
      throw parse_error(error_kind::scan_error, std::move(msg), location {document_path {}, where});
    }

  }

  event event::make(event_type type, mark start) {
    event ev;
    ev.type = type;
    ev.start = start;
    return ev;
  }

  event event::make_scalar(std::string text, scalar_style style, mark start) {
    event ev;
    ev.type = event_type::scalar;
    ev.text = std::move(text);
    ev.style = style;
    ev.start = start;
    return ev;
  }

  yaml_source::yaml_source(std::string yaml) :
    input(std::move(yaml)),
    parser(std::make_unique<yaml_parser_t>()),
    exhausted(false)
  {
    if (!yaml_parser_initialize(parser.get())) {
      throw std::runtime_error("concord::yaml_source failed to initialize yaml parser");
    }
    yaml_parser_set_input_string(parser.get(), reinterpret_cast<unsigned char const*>(input.data()), input.size());
  }

  yaml_source::~yaml_source() {
    yaml_parser_delete(parser.get());
  }

  event yaml_source::next() {
    if (exhausted) scan_failure("no events left after the end of the stream", mark {input.size(), 0, 0});

    // Get our next event, making sure it's released however we leave.
    yaml_event_t raw;
    if (!yaml_parser_parse(parser.get(), &raw)) {
      auto where = parser->error == YAML_READER_ERROR
        ? mark_at_offset(input, parser->problem_offset) : convert_mark(parser->problem_mark);
      std::string problem = parser->problem ? parser->problem : "malformed YAML";
      if (parser->context) problem = std::string {parser->context} + ": " + problem;
      scan_failure(std::move(problem), where);
    }
    auto cleanup = gsl::finally([&raw] { yaml_event_delete(&raw); });

    auto start = convert_mark(raw.start_mark);
    switch (raw.type) {
      case YAML_STREAM_START_EVENT:
        return event::make(event_type::stream_start, start);
      case YAML_STREAM_END_EVENT:
        exhausted = true;
        return event::make(event_type::stream_end, start);
      case YAML_DOCUMENT_START_EVENT:
        return event::make(event_type::document_start, start);
      case YAML_DOCUMENT_END_EVENT:
        return event::make(event_type::document_end, start);
      case YAML_MAPPING_START_EVENT:
        return event::make(event_type::mapping_start, start);
      case YAML_MAPPING_END_EVENT:
        return event::make(event_type::mapping_end, start);
      case YAML_SEQUENCE_START_EVENT:
        return event::make(event_type::sequence_start, start);
      case YAML_SEQUENCE_END_EVENT:
        return event::make(event_type::sequence_end, start);
      case YAML_SCALAR_EVENT:
        {
          auto* text = reinterpret_cast<char const*>(raw.data.scalar.value);
          auto len = gsl::narrow_cast<std::string::size_type>(raw.data.scalar.length);
          return event::make_scalar(std::string {text, len}, convert_style(raw.data.scalar.style), start);
        }
      case YAML_ALIAS_EVENT:
        // Well formed YAML, but no construct of the language accepts a reference.
        throw parse_error(error_kind::unexpected_syntax, "Expected a value, got alias",
            location {document_path {}, start});
      default:
        scan_failure("libyaml produced an unexpected event", start);
    }
  }

  event replay_source::next() {
    if (idx == events.size()) {
      mark where = events.empty() ? mark {} : events.back().start;
      scan_failure("no events left after the end of the stream", where);
    }
    return events[idx++];
  }

  char const* to_string(event_type type) noexcept {
    switch (type) {
      case event_type::stream_start:
        return "stream start";
      case event_type::stream_end:
        return "stream end";
      case event_type::document_start:
        return "document start";
      case event_type::document_end:
        return "document end";
      case event_type::mapping_start:
        return "mapping start";
      case event_type::mapping_end:
        return "mapping end";
      case event_type::sequence_start:
        return "sequence start";
      case event_type::sequence_end:
        return "sequence end";
      case event_type::scalar:
        return "scalar";
    }
    return "unknown event";
  }

  std::string describe(event const& ev) {
    if (!ev.is(event_type::scalar)) return to_string(ev.type);
    return "scalar '" + ev.text + "'";
  }

  std::ostream& operator <<(std::ostream& out, event_type type) {
    return out << to_string(type);
  }

}
