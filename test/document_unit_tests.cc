/*----- System Includes -----*/

#include <string>
#include <vector>

/*----- Local Includes -----*/

#include "concord_tests.h"

/*----- Namespace Inclusions -----*/

using concord::value;
using concord::error_kind;
using concord::definition_as;
using concord::test::parse;
using concord::test::parse_one;
using concord::test::parse_failure;
using concord::test::path_contains;

/*----- Function Implementations -----*/

SCENARIO("documents hold the top-level sections", "[document unit]") {
  GIVEN("a document with configuration, public flows and forms") {
    auto doc = parse_one(
      "configuration:\n"
      "  ratio: 123.456\n"
      "  debug: true\n"
      "publicFlows:\n"
      "  - main\n"
      "  - other\n"
      "forms:\n"
      "  myForm:\n"
      "    - firstName: {label: \"First name\", type: string}\n"
    );

    THEN("configuration keeps float text and order") {
      REQUIRE(doc.config);
      REQUIRE(doc.config->values.size() == 2);
      REQUIRE(doc.config->values[0].key == "ratio");
      REQUIRE(doc.config->values[0].val == value::make_decimal("123.456"));
      REQUIRE(doc.config->values[1].val == value::make_boolean(true));
      REQUIRE(doc.config->loc.line == 2);
    }
    THEN("public flows are plain strings") {
      REQUIRE(doc.public_flows);
      REQUIRE(*doc.public_flows == std::vector<std::string> {"main", "other"});
    }
    THEN("forms list their fields") {
      REQUIRE(doc.forms);
      REQUIRE(doc.forms->size() == 1);
      auto& fm = doc.forms->front();
      REQUIRE(fm.name == "myForm");
      REQUIRE(fm.loc.line == 8);
      REQUIRE(fm.fields.size() == 1);
      REQUIRE(fm.fields[0].name == "firstName");
      REQUIRE(fm.fields[0].options[0].key == "label");
      REQUIRE(fm.fields[0].options[0].val.str() == "First name");
    }
    THEN("absent sections stay empty") {
      REQUIRE_FALSE(doc.flows);
    }
  }

  GIVEN("a document with several flows") {
    auto doc = parse_one(
      "flows:\n"
      "  first:\n"
      "    - log: a\n"
      "  second:\n"
      "    - log: b\n"
      "    - log: c\n"
    );
    THEN("flows keep source order and their locations") {
      REQUIRE(doc.flows->size() == 2);
      REQUIRE((*doc.flows)[0].name == "first");
      REQUIRE((*doc.flows)[1].name == "second");
      REQUIRE((*doc.flows)[1].steps.size() == 2);
      REQUIRE((*doc.flows)[1].loc.line == 4);
      REQUIRE((*doc.flows)[1].loc.path == concord::document_path {"document", "'flows'"});
    }
  }

  GIVEN("an unknown top-level key") {
    auto err = parse_failure("flows:\n  main:\n    - log: a\nimports: []\n");
    THEN("it is rejected") {
      REQUIRE(err.kind() == error_kind::unexpected_syntax);
      REQUIRE(err.message() == "Unexpected top-level element 'imports'");
      REQUIRE(err.where()->line == 4);
    }
  }

  GIVEN("a document that is not a mapping") {
    auto err = parse_failure("- a\n- b\n");
    THEN("it is rejected") {
      REQUIRE(err.message() == "Expected mapping start, got sequence start");
    }
  }

  GIVEN("an empty flow") {
    auto err = parse_failure("flows:\n  main: []\n");
    THEN("flows need at least one step") {
      REQUIRE(err.kind() == error_kind::unexpected_syntax);
    }
  }
}

SCENARIO("streams hold one document per YAML document", "[document unit]") {
  GIVEN("two documents separated by ---") {
    auto docs = parse(
      "flows:\n"
      "  one:\n"
      "    - log: first\n"
      "---\n"
      "flows:\n"
      "  two:\n"
      "    - log: second\n"
    );
    THEN("each one parses to its own tree, in order") {
      REQUIRE(docs.size() == 2);
      REQUIRE(docs[0].flows->size() == 1);
      REQUIRE(docs[0].flows->front().name == "one");
      REQUIRE(docs[1].flows->size() == 1);
      REQUIRE(docs[1].flows->front().name == "two");
      REQUIRE(docs[1].flows->front().loc.line == 6);
    }
  }

  GIVEN("an empty input") {
    auto docs = parse("");
    THEN("there are no documents") {
      REQUIRE(docs.empty());
    }
  }

  GIVEN("events from somewhere other than libyaml") {
    using concord::event_type;
    using concord::test::ev;
    using concord::test::scalar;
    concord::replay_source src {{
      ev(event_type::stream_start),
      ev(event_type::document_start),
      ev(event_type::mapping_start),
      scalar("publicFlows"),
      ev(event_type::sequence_start),
      scalar("main", concord::scalar_style::double_quoted),
      ev(event_type::sequence_end),
      ev(event_type::mapping_end),
      ev(event_type::document_end),
      ev(event_type::stream_end)
    }};
    concord::cursor in {src};
    auto docs = concord::parse_stream(in);
    THEN("they parse the same way") {
      REQUIRE(docs.size() == 1);
      REQUIRE(docs[0].public_flows->front() == "main");
      REQUIRE(in.depth() == 0);
    }
  }
}

SCENARIO("errors carry the breadcrumb path", "[document unit]") {
  GIVEN("a bad third step in a flow") {
    auto err = parse_failure(
      "flows:\n"
      "  myFlow:\n"
      "    - log: one\n"
      "    - log: two\n"
      "    - task: three\n"
      "      foobar: 1\n"
    );
    THEN("the location names the flow and the step") {
      REQUIRE(err.where());
      auto& where = *err.where();
      REQUIRE(path_contains(where, "'myFlow' flow"));
      REQUIRE(path_contains(where, "step 3"));
      REQUIRE(concord::to_string(where.path) == "document->'flows'->'myFlow' flow->step 3->'three' task call");
      REQUIRE(where.line == 5);
    }
    THEN("the formatted message includes all of it") {
      std::string what = err.what();
      REQUIRE(what.find("unexpected syntax") == 0);
      REQUIRE(what.find("'myFlow' flow->step 3") != std::string::npos);
      REQUIRE(what.find("Unexpected task call element 'foobar'") != std::string::npos);
    }
  }

  GIVEN("a failure deep in a nested block") {
    auto err = parse_failure(
      "flows:\n"
      "  main:\n"
      "    - if: ${x}\n"
      "      then:\n"
      "        - log: fine\n"
      "        - nope: 1\n"
    );
    THEN("the path follows the nesting") {
      REQUIRE(concord::to_string(err.where()->path) == "document->'flows'->'main' flow->step 1->if '${x}'->'then' block->step 2");
    }
  }

  GIVEN("a failure in a later document") {
    auto err = parse_failure("flows:\n  a:\n    - log: x\n---\nflows:\n  b:\n    - bogus: 1\n");
    THEN("earlier documents leave no breadcrumbs behind") {
      REQUIRE(concord::to_string(err.where()->path) == "document->'flows'->'b' flow->step 1");
      REQUIRE(err.where()->line == 7);
    }
  }
}

SCENARIO("a realistic definition parses end to end", "[document unit]") {
  GIVEN("the complex fixture") {
    auto docs = parse(concord::test::read_data_file("complex.concord.yaml"));
    REQUIRE(docs.size() == 1);
    auto& doc = docs.front();

    THEN("configuration values are typed") {
      auto& values = doc.config->values;
      REQUIRE(values[0].val.str() == "concord-v2");
      REQUIRE(values[1].val[0].str() == "mvn://com.example:deploy-task:1.8.0");
      REQUIRE(values[2].val["limits"]["cpu"]["cores"].integer() == 4);
      REQUIRE(values[2].val["ratio"].decimal() == "0.75");
      REQUIRE(values[3].val.boolean());
      REQUIRE(values[4].val.str() == "PT30M");
    }

    THEN("the release flow has every construct") {
      auto& release = doc.flows->at(0);
      REQUIRE(release.name == "release");
      REQUIRE(release.steps.size() == 5);
      REQUIRE(*release.steps[1].step_name == "Build");
      REQUIRE(definition_as<concord::task_call>(release.steps[1]).retries->times->integer() == 2);

      auto& branch = definition_as<concord::if_block>(release.steps[2]);
      auto& publish = definition_as<concord::flow_call>(branch.then_steps[0]);
      REQUIRE(publish.looping->items.str() == "${regions}");
      REQUIRE(definition_as<concord::task_call>(branch.else_steps->at(0)).task_name == "throw");

      auto& sw = definition_as<concord::switch_block>(release.steps[3]);
      REQUIRE(sw.cases.size() == 1);
      REQUIRE(sw.cases[0].label.str() == "prod");
      REQUIRE(definition_as<concord::form_call>(sw.cases[0].steps[1]).fields->size() == 1);

      auto& attempt = definition_as<concord::block>(release.steps[4]);
      REQUIRE(*definition_as<concord::script>(attempt.steps[0]).body == "println \"done\"\n");
      REQUIRE(definition_as<concord::expression>(attempt.error->at(0)).output->str() == "notified");
    }

    THEN("the rollback flow and forms are there too") {
      auto& rollback = doc.flows->at(1);
      REQUIRE(definition_as<concord::set_variables>(rollback.steps[0]).vars.size() == 2);
      REQUIRE(definition_as<concord::parallel_block>(rollback.steps[1]).steps.size() == 2);
      REQUIRE(definition_as<concord::suspend>(rollback.steps[2]).event == "rollback-confirmed");
      REQUIRE(doc.forms->front().fields.size() == 2);
      REQUIRE(*doc.public_flows == std::vector<std::string> {"release", "rollback"});
    }
  }
}
