#if CONCORD_HAS_RAPIDJSON

/*----- System Includes -----*/

#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

/*----- Local Includes -----*/

#include "../include/concord/json.h"

/*----- Type Declarations -----*/

namespace concord {
  namespace {

    using json_writer = rapidjson::Writer<rapidjson::StringBuffer>;

    /**
     *  @brief
     *  Walks the tree and streams it through a rapidjson writer.
     *
     *  @details
     *  Optional fields that were never written in the source are omitted
     *  rather than written as null.
     */
    class json_emitter {

      public:

        /*----- Lifecycle Functions -----*/

        json_emitter(json_writer& writer, bool with_locations) :
          writer(writer),
          with_locations(with_locations)
        {}

        /*----- Public API -----*/

        void emit(document const& doc);
        void emit(value const& val);

      private:

        /*----- Private Helpers -----*/

        void key(char const* name) {
          writer.Key(name);
        }

        void string(std::string const& str) {
          writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
        }

        void emit_location(location const& loc);
        void emit(kv_list const& kvs);
        void emit(step_list const& steps);
        void emit(step const& s);
        void emit(loop const& looping);
        void emit(retry const& retries);
        void emit(std::vector<form_field> const& fields);

        template <class T>
        void field(char const* name, T const& val) {
          key(name);
          emit(val);
        }

        template <class T>
        void field(char const* name, shim::optional<T> const& val) {
          if (val) field(name, *val);
        }

        void field(char const* name, std::string const& str) {
          key(name);
          string(str);
        }

        void field(char const* name, shim::optional<std::string> const& str) {
          if (str) field(name, *str);
        }

        void field(char const* name, shim::optional<bool> const& flag) {
          if (!flag) return;
          key(name);
          writer.Bool(*flag);
        }

        /*----- Private Members -----*/

        json_writer& writer;
        bool with_locations;

    };

  }
}

/*----- Function Implementations -----*/

namespace concord {

  namespace {

    void json_emitter::emit(document const& doc) {
      writer.StartObject();
      if (doc.config) {
        key("configuration");
        writer.StartObject();
        if (with_locations) emit_location(doc.config->loc);
        field("values", doc.config->values);
        writer.EndObject();
      }
      if (doc.flows) {
        key("flows");
        writer.StartArray();
        for (auto const& fl : *doc.flows) {
          writer.StartObject();
          field("name", fl.name);
          if (with_locations) emit_location(fl.loc);
          field("steps", fl.steps);
          writer.EndObject();
        }
        writer.EndArray();
      }
      if (doc.forms) {
        key("forms");
        writer.StartArray();
        for (auto const& fm : *doc.forms) {
          writer.StartObject();
          field("name", fm.name);
          if (with_locations) emit_location(fm.loc);
          field("fields", fm.fields);
          writer.EndObject();
        }
        writer.EndArray();
      }
      if (doc.public_flows) {
        key("publicFlows");
        writer.StartArray();
        for (auto const& name : *doc.public_flows) string(name);
        writer.EndArray();
      }
      writer.EndObject();
    }

    void json_emitter::emit(value const& val) {
      switch (val.get_type()) {
        case value::type::string:
          string(val.str());
          break;
        case value::type::boolean:
          writer.Bool(val.boolean());
          break;
        case value::type::decimal:
          // Written as text, JSON numbers can't carry ".inf" or the exact spelling.
          string(val.decimal());
          break;
        case value::type::integer:
          writer.Int64(val.integer());
          break;
        case value::type::array:
          writer.StartArray();
          for (auto const& elem : val.array()) emit(elem);
          writer.EndArray();
          break;
        case value::type::mapping:
          emit(val.mapping());
          break;
      }
    }

    void json_emitter::emit_location(location const& loc) {
      key("location");
      writer.StartObject();
      key("path");
      string(to_string(loc.path));
      key("index");
      writer.Uint64(loc.index);
      key("line");
      writer.Uint64(loc.line);
      key("column");
      writer.Uint64(loc.column);
      writer.EndObject();
    }

    void json_emitter::emit(kv_list const& kvs) {
      writer.StartObject();
      for (auto const& entry : kvs) {
        writer.Key(entry.key.data(), static_cast<rapidjson::SizeType>(entry.key.size()));
        emit(entry.val);
      }
      writer.EndObject();
    }

    void json_emitter::emit(step_list const& steps) {
      writer.StartArray();
      for (auto const& s : steps) emit(s);
      writer.EndArray();
    }

    void json_emitter::emit(step const& s) {
      writer.StartObject();
      key("kind");
      writer.String(step_kind(s.definition));
      field("name", s.step_name);
      if (with_locations) emit_location(s.loc);

      shim::visit(shim::compose_together(
        [this] (task_call const& def) {
          field("task", def.task_name);
          field("in", def.input);
          field("out", def.output);
          field("error", def.error);
          field("ignoreErrors", def.ignore_errors);
          field("loop", def.looping);
          field("meta", def.meta);
          field("retry", def.retries);
        },
        [this] (expression const& def) {
          field("expr", def.expr);
          field("out", def.output);
          field("error", def.error);
          field("meta", def.meta);
        },
        [this] (script const& def) {
          field("script", def.language_or_ref);
          field("body", def.body);
          field("in", def.input);
          field("out", def.output);
          field("error", def.error);
          field("loop", def.looping);
          field("meta", def.meta);
          field("retry", def.retries);
        },
        [this] (flow_call const& def) {
          field("call", def.flow_name);
          field("in", def.input);
          field("out", def.output);
          field("error", def.error);
          field("loop", def.looping);
          field("meta", def.meta);
          field("retry", def.retries);
        },
        [this] (checkpoint const& def) {
          field("checkpoint", def.name);
          field("meta", def.meta);
        },
        [this] (if_block const& def) {
          field("if", def.expression);
          field("then", def.then_steps);
          field("else", def.else_steps);
          field("meta", def.meta);
        },
        [this] (set_variables const& def) {
          field("set", def.vars);
          field("meta", def.meta);
        },
        [this] (parallel_block const& def) {
          field("parallel", def.steps);
          field("out", def.output);
          field("meta", def.meta);
        },
        [this] (block const& def) {
          field("block", def.steps);
          field("out", def.output);
          field("error", def.error);
          field("loop", def.looping);
          field("meta", def.meta);
        },
        [this] (switch_block const& def) {
          field("switch", def.expression);
          key("cases");
          writer.StartArray();
          for (auto const& c : def.cases) {
            writer.StartObject();
            field("label", c.label);
            field("steps", c.steps);
            writer.EndObject();
          }
          writer.EndArray();
          field("default", def.default_steps);
          field("meta", def.meta);
        },
        [this] (suspend const& def) {
          field("suspend", def.event);
          field("meta", def.meta);
        },
        [this] (form_call const& def) {
          field("form", def.form_name);
          field("yield", def.yield_execution);
          field("saveSubmittedBy", def.save_submitted_by);
          field("runAs", def.run_as);
          field("values", def.values);
          field("fields", def.fields);
          field("meta", def.meta);
        }
      ), s.definition);

      writer.EndObject();
    }

    void json_emitter::emit(loop const& looping) {
      writer.StartObject();
      if (with_locations) emit_location(looping.loc);
      field("items", looping.items);
      if (looping.mode) {
        key("mode");
        writer.String(*looping.mode == loop_mode::parallel ? "parallel" : "serial");
      }
      field("parallelism", looping.parallelism);
      writer.EndObject();
    }

    void json_emitter::emit(retry const& retries) {
      writer.StartObject();
      if (with_locations) emit_location(retries.loc);
      field("times", retries.times);
      field("delay", retries.delay);
      field("in", retries.input);
      writer.EndObject();
    }

    void json_emitter::emit(std::vector<form_field> const& fields) {
      writer.StartArray();
      for (auto const& f : fields) {
        writer.StartObject();
        field("name", f.name);
        if (with_locations) emit_location(f.loc);
        field("options", f.options);
        writer.EndObject();
      }
      writer.EndArray();
    }

  }

  std::string to_json(document const& doc, bool with_locations) {
    rapidjson::StringBuffer buffer;
    json_writer writer {buffer};
    json_emitter {writer, with_locations}.emit(doc);
    return std::string {buffer.GetString(), buffer.GetSize()};
  }

  std::string to_json(std::vector<document> const& docs, bool with_locations) {
    rapidjson::StringBuffer buffer;
    json_writer writer {buffer};
    json_emitter emitter {writer, with_locations};
    writer.StartArray();
    for (auto const& doc : docs) emitter.emit(doc);
    writer.EndArray();
    return std::string {buffer.GetString(), buffer.GetSize()};
  }

  std::string to_json(value const& val) {
    rapidjson::StringBuffer buffer;
    json_writer writer {buffer};
    json_emitter {writer, false}.emit(val);
    return std::string {buffer.GetString(), buffer.GetSize()};
  }

}

#endif
