/*----- System Includes -----*/

#include <string>
#include <utility>

/*----- Local Includes -----*/

#include "grammar.h"

/*----- Type Declarations -----*/

namespace concord {
  namespace {

    using step_parser = step_definition (*)(cursor&, shim::optional<std::string>&);

    struct step_keyword {
      shim::string_view keyword;
      step_parser parse;
    };

  }
}

/*----- Function Implementations -----*/

namespace concord {

  namespace detail {

    bool parse_bool(cursor& in) {
      auto decoded = decode_value(in);
      if (!decoded.val.is_boolean()) {
        in.fail(decoded.start, "Expected a bool value, got " + to_string(decoded.val));
      }
      return decoded.val.boolean();
    }

    kv_list parse_kv_list(cursor& in) {
      in.expect(event_type::mapping_start);
      auto values = parse_until(in, event_type::mapping_end, decode_kv);
      in.expect(event_type::mapping_end);
      return values;
    }

  }

  namespace {

    using namespace detail;

    loop_mode parse_loop_mode(cursor& in) {
      auto mode = in.expect_scalar();
      if (mode.text == "parallel") return loop_mode::parallel;
      else if (mode.text == "serial") return loop_mode::serial;
      in.fail(mode.start, "Unexpected loop mode '" + mode.text + "'. Only 'parallel' and 'serial' are supported.");
    }

    loop parse_loop(cursor& in) {
      auto start = in.expect(event_type::mapping_start).start;

      loop looping;
      looping.loc = in.locate(start);
      shim::optional<value> items;
      while (!in.at(event_type::mapping_end)) {
        auto element = in.peek_scalar();
        in.next();
        if (element == "items") items = with_context(in, "loop items", parse_value);
        else if (element == "mode") looping.mode = with_context(in, "loop mode", parse_loop_mode);
        else if (element == "parallelism") looping.parallelism = with_context(in, "loop parallelism", parse_value);
        else in.fail(looping.loc, "Unexpected loop element '" + element + "'");
      }
      in.expect(event_type::mapping_end);

      if (!items) in.fail(looping.loc, "The 'items' field is required in the loop");
      looping.items = std::move(*items);
      return looping;
    }

    retry parse_retry(cursor& in) {
      auto start = in.expect(event_type::mapping_start).start;

      retry retries;
      retries.loc = in.locate(start);
      while (!in.at(event_type::mapping_end)) {
        auto element = in.peek_scalar();
        in.next();
        if (element == "times") retries.times = with_context(in, "retry 'times' option", parse_value);
        else if (element == "delay") retries.delay = with_context(in, "retry delay", parse_value);
        else if (element == "in") retries.input = with_context(in, "retry input", parse_value);
        else in.fail(retries.loc, "Unexpected retry element '" + element + "'");
      }
      in.expect(event_type::mapping_end);
      return retries;
    }

    step_definition parse_task_call(cursor& in, shim::optional<std::string>& step_name) {
      auto name = in.expect_scalar();
      auto guard = in.enter("'" + name.text + "' task call");
      auto where = in.locate(name.start);

      task_call call;
      call.task_name = std::move(name.text);
      parse_modifiers(in, step_name, where, "task call", [&] (std::string const& element) {
        if (element == "in") call.input = with_context(in, "'in' parameters", parse_value);
        else if (element == "out") call.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "error") call.error = with_context(in, "'error' block", parse_steps);
        else if (element == "ignoreErrors") call.ignore_errors = with_context(in, "'ignoreErrors' option", parse_bool);
        else if (element == "loop") call.looping = with_context(in, "'loop' option", parse_loop);
        else if (element == "meta") call.meta = with_context(in, "'meta' block", parse_meta);
        else if (element == "retry") call.retries = with_context(in, "'retry' option", parse_retry);
        else return false;
        return true;
      });
      return call;
    }

    /**
     *  @brief
     *  Shorthand steps ("log: ...", "throw: ...") that are really task calls
     *  taking their value as a single named input.
     */
    step_definition parse_shorthand_call(cursor& in, shim::optional<std::string>& step_name,
        char const* task_name, char const* parameter, shim::optional<std::pair<char const*, char const*>> extra) {
      auto guard = in.enter(task_name);
      auto decoded = decode_value(in);
      auto where = in.locate(decoded.start);

      task_call call;
      call.task_name = task_name;
      parse_modifiers(in, step_name, where, task_name, [&] (std::string const& element) {
        if (element == "meta") call.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });

      kv_list input;
      input.push_back(kv {where, parameter, std::move(decoded.val)});
      if (extra) input.push_back(kv {where, extra->first, value::make_string(extra->second)});
      call.input = value::make_mapping(std::move(input));
      return call;
    }

    step_definition parse_log(cursor& in, shim::optional<std::string>& step_name) {
      return parse_shorthand_call(in, step_name, "log", "msg", shim::nullopt);
    }

    step_definition parse_log_yaml(cursor& in, shim::optional<std::string>& step_name) {
      return parse_shorthand_call(in, step_name, "log", "msg", std::make_pair("format", "yaml"));
    }

    step_definition parse_throw(cursor& in, shim::optional<std::string>& step_name) {
      return parse_shorthand_call(in, step_name, "throw", "exception", shim::nullopt);
    }

    step_definition parse_expression(cursor& in, shim::optional<std::string>& step_name) {
      auto expr = in.expect_scalar();
      auto guard = in.enter("expression '" + expr.text + "'");
      auto where = in.locate(expr.start);

      expression result;
      result.expr = std::move(expr.text);
      parse_modifiers(in, step_name, where, "expr step", [&] (std::string const& element) {
        if (element == "out") result.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "error") result.error = with_context(in, "'error' block", parse_steps);
        else if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_script(cursor& in, shim::optional<std::string>& step_name) {
      auto language_or_ref = in.expect_scalar();
      auto guard = in.enter("script '" + language_or_ref.text + "'");
      auto where = in.locate(language_or_ref.start);

      script result;
      result.language_or_ref = std::move(language_or_ref.text);
      parse_modifiers(in, step_name, where, "script step", [&] (std::string const& element) {
        if (element == "body") result.body = with_context(in, "script body", parse_string);
        else if (element == "in") result.input = with_context(in, "'in' parameters", parse_value);
        else if (element == "out") result.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "error") result.error = with_context(in, "'error' block", parse_steps);
        else if (element == "loop") result.looping = with_context(in, "'loop' option", parse_loop);
        else if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else if (element == "retry") result.retries = with_context(in, "'retry' option", parse_retry);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_flow_call(cursor& in, shim::optional<std::string>& step_name) {
      auto flow_name = in.expect_scalar();
      auto guard = in.enter("call '" + flow_name.text + "'");
      auto where = in.locate(flow_name.start);

      flow_call call;
      call.flow_name = std::move(flow_name.text);
      parse_modifiers(in, step_name, where, "flow call", [&] (std::string const& element) {
        if (element == "in") call.input = with_context(in, "'in' parameters", parse_value);
        else if (element == "out") call.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "error") call.error = with_context(in, "'error' block", parse_steps);
        else if (element == "loop") call.looping = with_context(in, "'loop' option", parse_loop);
        else if (element == "meta") call.meta = with_context(in, "'meta' block", parse_meta);
        else if (element == "retry") call.retries = with_context(in, "'retry' option", parse_retry);
        else return false;
        return true;
      });
      return call;
    }

    step_definition parse_checkpoint(cursor& in, shim::optional<std::string>& step_name) {
      auto name = in.expect_scalar();
      auto guard = in.enter("checkpoint '" + name.text + "'");
      auto where = in.locate(name.start);

      checkpoint result;
      result.name = std::move(name.text);
      parse_modifiers(in, step_name, where, "checkpoint", [&] (std::string const& element) {
        if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_if(cursor& in, shim::optional<std::string>& step_name) {
      auto expr = in.expect_scalar();
      auto guard = in.enter("if '" + expr.text + "'");
      auto where = in.locate(expr.start);

      if_block result;
      result.expression = std::move(expr.text);
      shim::optional<step_list> then_steps;
      parse_modifiers(in, step_name, where, "if block", [&] (std::string const& element) {
        if (element == "then") then_steps = with_context(in, "'then' block", parse_steps);
        else if (element == "else") result.else_steps = with_context(in, "'else' block", parse_steps);
        else if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });

      if (!then_steps) in.fail(where, "The 'then' steps are required in 'if' block");
      result.then_steps = std::move(*then_steps);
      return result;
    }

    step_definition parse_set_variables(cursor& in, shim::optional<std::string>& step_name) {
      auto guard = in.enter("set");
      auto where = in.locate(in.peek().start);

      set_variables result;
      result.vars = parse_kv_list(in);
      parse_modifiers(in, step_name, where, "set", [&] (std::string const& element) {
        if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_parallel_block(cursor& in, shim::optional<std::string>& step_name) {
      auto guard = in.enter("'parallel' block");
      auto where = in.locate(in.peek().start);

      parallel_block result;
      result.steps = parse_steps(in);
      parse_modifiers(in, step_name, where, "parallel block", [&] (std::string const& element) {
        if (element == "out") result.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_block(cursor& in, shim::optional<std::string>& step_name) {
      auto guard = in.enter("block");
      auto where = in.locate(in.peek().start);

      block result;
      result.steps = parse_steps(in);
      parse_modifiers(in, step_name, where, "block", [&] (std::string const& element) {
        if (element == "out") result.output = with_context(in, "'out' parameters", parse_value);
        else if (element == "error") result.error = with_context(in, "'error' block", parse_steps);
        else if (element == "loop") result.looping = with_context(in, "'loop' option", parse_loop);
        else if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    // Every key after the expression is a case label, decoded as a value, so
    // "name" has to come before "switch" here.
    step_definition parse_switch(cursor& in, shim::optional<std::string>&) {
      auto expr = in.expect_scalar();
      auto guard = in.enter("switch '" + expr.text + "'");
      auto where = in.locate(expr.start);

      switch_block result;
      result.expression = std::move(expr.text);
      while (!in.at(event_type::mapping_end)) {
        auto label = decode_value(in).val;
        if (label.is_str() && label.str() == "default") {
          result.default_steps = with_context(in, "'default' block", parse_steps);
        } else if (label.is_str() && label.str() == "meta") {
          result.meta = with_context(in, "'meta' block", parse_meta);
        } else {
          auto steps = with_context(in, "case " + to_string(label) + " steps", parse_steps);
          result.cases.push_back(switch_case {std::move(label), std::move(steps)});
        }
      }

      if (result.cases.empty() && !result.default_steps) {
        in.fail(where, "The 'switch' block requires at least one case and/or the 'default' block");
      }
      return result;
    }

    step_definition parse_suspend(cursor& in, shim::optional<std::string>& step_name) {
      auto event_name = in.expect_scalar();
      auto guard = in.enter("suspend on '" + event_name.text + "'");
      auto where = in.locate(event_name.start);

      suspend result;
      result.event = std::move(event_name.text);
      parse_modifiers(in, step_name, where, "suspend", [&] (std::string const& element) {
        if (element == "meta") result.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return result;
    }

    step_definition parse_form_call(cursor& in, shim::optional<std::string>& step_name) {
      auto form_name = in.expect_scalar();
      auto guard = in.enter("'" + form_name.text + "' form call");
      auto where = in.locate(form_name.start);

      form_call call;
      call.form_name = std::move(form_name.text);
      parse_modifiers(in, step_name, where, "form call", [&] (std::string const& element) {
        if (element == "yield") call.yield_execution = with_context(in, "'yield' option", parse_bool);
        else if (element == "saveSubmittedBy") {
          call.save_submitted_by = with_context(in, "'saveSubmittedBy' option", parse_bool);
        }
        else if (element == "runAs") call.run_as = with_context(in, "'runAs' option", parse_value);
        else if (element == "values") call.values = with_context(in, "'values' option", parse_value);
        else if (element == "fields") call.fields = with_context(in, "'fields' option", parse_form_fields);
        else if (element == "meta") call.meta = with_context(in, "'meta' block", parse_meta);
        else return false;
        return true;
      });
      return call;
    }

    constexpr step_keyword step_keywords[] = {
      {"task", parse_task_call},
      {"expr", parse_expression},
      {"script", parse_script},
      {"call", parse_flow_call},
      {"checkpoint", parse_checkpoint},
      {"if", parse_if},
      {"set", parse_set_variables},
      {"parallel", parse_parallel_block},
      {"try", parse_block},
      {"block", parse_block},
      {"switch", parse_switch},
      {"suspend", parse_suspend},
      {"form", parse_form_call},
      {"log", parse_log},
      {"logYaml", parse_log_yaml},
      {"throw", parse_throw}
    };

    step_parser find_step_parser(shim::string_view keyword) noexcept {
      for (auto const& entry : step_keywords) {
        if (entry.keyword == keyword) return entry.parse;
      }
      return nullptr;
    }

  }

  step parse_step(cursor& in) {
    auto start = in.expect(event_type::mapping_start).start;
    auto where = in.locate(start);

    shim::optional<std::string> step_name;
    shim::optional<step_definition> definition;
    while (!in.at(event_type::mapping_end)) {
      auto key = in.peek_scalar();
      in.next();
      if (key == "name") {
        step_name = detail::parse_string(in);
        continue;
      }

      auto parse = find_step_parser(key);
      if (!parse) in.fail(where, "Unknown step '" + key + "'");
      definition = parse(in, step_name);
    }
    in.expect(event_type::mapping_end);

    if (!definition) in.fail(where, "Expected a step");
    return step {std::move(where), std::move(step_name), std::move(*definition)};
  }

  step_list parse_steps(cursor& in) {
    in.expect(event_type::sequence_start);
    std::size_t count = 0;
    auto steps = detail::parse_until(in, event_type::sequence_end, [&count] (cursor& cur) {
      return detail::with_context(cur, "step " + std::to_string(++count), parse_step);
    });
    in.expect(event_type::sequence_end);
    return steps;
  }

  char const* step_kind(step_definition const& def) noexcept {
    return shim::visit(shim::compose_together(
      [] (task_call const&) { return "task"; },
      [] (expression const&) { return "expr"; },
      [] (script const&) { return "script"; },
      [] (flow_call const&) { return "call"; },
      [] (checkpoint const&) { return "checkpoint"; },
      [] (if_block const&) { return "if"; },
      [] (set_variables const&) { return "set"; },
      [] (parallel_block const&) { return "parallel"; },
      [] (block const&) { return "block"; },
      [] (switch_block const&) { return "switch"; },
      [] (suspend const&) { return "suspend"; },
      [] (form_call const&) { return "form"; }
    ), def);
  }

}
