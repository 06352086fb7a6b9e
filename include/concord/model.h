#ifndef CONCORD_MODEL_H
#define CONCORD_MODEL_H

/*----- System Includes -----*/

#include <string>
#include <vector>

/*----- Local Includes -----*/

#include "value.h"

/*----- Type Declarations -----*/

namespace concord {

  struct step;
  using step_list = std::vector<step>;

  enum class loop_mode {
    serial,
    parallel
  };

  struct loop {
    location loc;
    value items;
    shim::optional<loop_mode> mode;
    shim::optional<value> parallelism;
  };

  struct retry {
    location loc;
    shim::optional<value> times;
    shim::optional<value> delay;
    shim::optional<value> input;
  };

  /*----- Step Definitions -----*/

  struct task_call {
    std::string task_name;
    shim::optional<value> input;
    shim::optional<value> output;
    shim::optional<step_list> error;
    shim::optional<bool> ignore_errors;
    shim::optional<loop> looping;
    shim::optional<kv_list> meta;
    shim::optional<retry> retries;
  };

  struct expression {
    std::string expr;
    shim::optional<value> output;
    shim::optional<step_list> error;
    shim::optional<kv_list> meta;
  };

  struct script {
    std::string language_or_ref;
    shim::optional<std::string> body;
    shim::optional<value> input;
    shim::optional<value> output;
    shim::optional<step_list> error;
    shim::optional<loop> looping;
    shim::optional<kv_list> meta;
    shim::optional<retry> retries;
  };

  struct flow_call {
    std::string flow_name;
    shim::optional<value> input;
    shim::optional<value> output;
    shim::optional<step_list> error;
    shim::optional<loop> looping;
    shim::optional<kv_list> meta;
    shim::optional<retry> retries;
  };

  struct checkpoint {
    std::string name;
    shim::optional<kv_list> meta;
  };

  struct if_block {
    std::string expression;
    step_list then_steps;
    shim::optional<step_list> else_steps;
    shim::optional<kv_list> meta;
  };

  struct set_variables {
    kv_list vars;
    shim::optional<kv_list> meta;
  };

  struct parallel_block {
    step_list steps;
    shim::optional<value> output;
    shim::optional<kv_list> meta;
  };

  // "try" and "block" both produce this.
  struct block {
    step_list steps;
    shim::optional<value> output;
    shim::optional<step_list> error;
    shim::optional<loop> looping;
    shim::optional<kv_list> meta;
  };

  struct switch_case {
    value label;
    step_list steps;
  };

  struct switch_block {
    std::string expression;
    std::vector<switch_case> cases;
    shim::optional<step_list> default_steps;
    shim::optional<kv_list> meta;
  };

  struct suspend {
    std::string event;
    shim::optional<kv_list> meta;
  };

  struct form_field {
    location loc;
    std::string name;
    kv_list options;
  };

  struct form_call {
    std::string form_name;
    shim::optional<bool> yield_execution;
    shim::optional<bool> save_submitted_by;
    shim::optional<value> run_as;
    shim::optional<value> values;
    shim::optional<std::vector<form_field>> fields;
    shim::optional<kv_list> meta;
  };

  /**
   *  @brief
   *  Closed set of step kinds.
   *
   *  @details
   *  Consumers are expected to shim::visit this with an overload for every
   *  alternative, so adding a kind breaks every consumer that forgot it.
   */
  using step_definition = shim::variant<
    task_call,
    expression,
    script,
    flow_call,
    checkpoint,
    if_block,
    set_variables,
    parallel_block,
    block,
    switch_block,
    suspend,
    form_call
  >;

  struct step {
    location loc;
    shim::optional<std::string> step_name;
    step_definition definition;
  };

  /*----- Document Level -----*/

  struct flow {
    location loc;
    std::string name;
    step_list steps;
  };

  struct form {
    location loc;
    std::string name;
    std::vector<form_field> fields;
  };

  struct configuration {
    location loc;
    kv_list values;
  };

  /**
   *  @brief
   *  Root of the tree, one per YAML document in the input stream.
   */
  struct document {
    shim::optional<configuration> config;
    shim::optional<std::vector<flow>> flows;
    shim::optional<std::vector<form>> forms;
    shim::optional<std::vector<std::string>> public_flows;
  };

  /*----- Free Functions -----*/

  // Keyword naming the kind of step ("task", "if", "try"...).
  char const* step_kind(step_definition const& def) noexcept;

  template <class Definition>
  Definition const& definition_as(step const& s) {
    auto* def = shim::get_if<Definition>(&s.definition);
    if (!def) throw type_error("concord::step does not hold the requested step kind");
    return *def;
  }

}

#endif
