/*----- System Includes -----*/

#include <string>

/*----- Local Includes -----*/

#include "grammar.h"

/*----- Function Implementations -----*/

namespace concord {

  namespace detail {

    std::vector<form_field> parse_form_fields(cursor& in) {
      in.expect(event_type::sequence_start);
      auto fields = parse_until(in, event_type::sequence_end, [] (cursor& cur) {
        cur.expect(event_type::mapping_start);
        auto name = cur.expect_scalar();

        form_field field;
        {
          auto guard = cur.enter("'" + name.text + "' field");
          field.options = parse_kv_list(cur);
        }
        cur.expect(event_type::mapping_end);

        field.loc = cur.locate(name.start);
        field.name = std::move(name.text);
        return field;
      });
      in.expect(event_type::sequence_end);
      return fields;
    }

  }

  namespace {

    using namespace detail;

    std::vector<std::string> parse_list_of_strings(cursor& in) {
      in.expect(event_type::sequence_start);
      auto values = parse_until(in, event_type::sequence_end, parse_string);
      in.expect(event_type::sequence_end);
      return values;
    }

    form parse_form(cursor& in) {
      auto name = in.expect_scalar();
      auto fields = with_context(in, "'" + name.text + "' form", parse_form_fields);
      return form {in.locate(name.start), std::move(name.text), std::move(fields)};
    }

    std::vector<form> parse_forms(cursor& in) {
      in.expect(event_type::mapping_start);
      auto forms = parse_until(in, event_type::mapping_end, parse_form);
      in.expect(event_type::mapping_end);
      return forms;
    }

    flow parse_flow(cursor& in) {
      auto name = in.expect_scalar();
      auto steps = with_context(in, "'" + name.text + "' flow", parse_steps);
      return flow {in.locate(name.start), std::move(name.text), std::move(steps)};
    }

    std::vector<flow> parse_flows(cursor& in) {
      in.expect(event_type::mapping_start);
      auto flows = parse_until(in, event_type::mapping_end, parse_flow);
      in.expect(event_type::mapping_end);
      return flows;
    }

    configuration parse_configuration(cursor& in) {
      auto where = in.locate(in.peek().start);
      auto values = parse_kv_list(in);
      return configuration {std::move(where), std::move(values)};
    }

  }

  document parse_document(cursor& in) {
    in.expect(event_type::document_start);
    in.expect(event_type::mapping_start);

    document doc;
    while (!in.at(event_type::mapping_end)) {
      auto element = in.peek_scalar();
      auto start = in.next().start;
      if (element == "configuration") doc.config = detail::with_context(in, "'configuration'", parse_configuration);
      else if (element == "flows") doc.flows = detail::with_context(in, "'flows'", parse_flows);
      else if (element == "forms") doc.forms = detail::with_context(in, "'forms'", parse_forms);
      else if (element == "publicFlows") doc.public_flows = detail::with_context(in, "'publicFlows'", parse_list_of_strings);
      else in.fail(start, "Unexpected top-level element '" + element + "'");
    }

    in.expect(event_type::mapping_end);
    in.expect(event_type::document_end);
    return doc;
  }

  std::vector<document> parse_stream(cursor& in) {
    in.expect(event_type::stream_start);

    std::vector<document> docs;
    {
      auto guard = in.enter("document");
      while (!in.at(event_type::stream_end)) {
        docs.push_back(parse_document(in));
      }
    }

    in.expect(event_type::stream_end);
    return docs;
  }

  std::vector<document> parse_stream(std::string yaml) {
    yaml_source src {std::move(yaml)};
    cursor in {src};
    return parse_stream(in);
  }

}
