#ifndef CONCORD_VALUE_H
#define CONCORD_VALUE_H

/*----- System Includes -----*/

#include <string>
#include <vector>
#include <cstdint>

/*----- Local Includes -----*/

#include "common.h"

/*----- Type Declarations -----*/

namespace concord {

  struct kv;

  /**
   *  @brief
   *  Float stored as the exact text it was written with.
   *
   *  @details
   *  Keeping the source text avoids precision drift and reformatting.
   *  Conversion to a binary double is left to whoever consumes the value.
   */
  struct decimal_text {
    std::string text;
  };

  /**
   *  @brief
   *  Dynamically typed data unit used for every free-form field of the language
   *  (task inputs/outputs, variables, case labels, configuration).
   *
   *  @details
   *  Mappings are ordered lists of key/value pairs. Duplicate keys are kept in
   *  source order, nothing is deduplicated.
   */
  class value {

    public:

      /*----- Public Types -----*/

      enum class type {
        string,
        boolean,
        decimal,
        integer,
        array,
        mapping
      };

      using array_type = std::vector<value>;
      using mapping_type = std::vector<kv>;

      /*----- Lifecycle Functions -----*/

      value();
      value(value const&) = default;
      value(value&&) = default;
      ~value() = default;

      /*----- Operators -----*/

      value& operator =(value const&) = default;
      value& operator =(value&&) = default;

      bool operator ==(value const& other) const;
      bool operator !=(value const& other) const;

      /*----- Factories -----*/

      static value make_string(std::string val);
      static value make_boolean(bool val);
      static value make_decimal(std::string text);
      static value make_integer(int64_t val);
      static value make_array(array_type vals = {});
      static value make_mapping(mapping_type vals = {});

      /*----- Introspection -----*/

      type get_type() const noexcept;

      bool is_str() const noexcept;
      bool is_boolean() const noexcept;
      bool is_decimal() const noexcept;
      bool is_integer() const noexcept;
      bool is_array() const noexcept;
      bool is_mapping() const noexcept;

      /*----- Accessors -----*/

      // All accessors throw type_error if the value holds something else.
      std::string const& str() const;
      bool boolean() const;
      std::string const& decimal() const;
      int64_t integer() const;
      array_type const& array() const;
      mapping_type const& mapping() const;

      // Mutable access used while decoding.
      array_type& array();
      mapping_type& mapping();

      // Number of elements for aggregates, zero otherwise.
      std::size_t size() const noexcept;

      // Convenience lookup of the first entry with the given key. Throws
      // type_error on non-mappings, std::out_of_range if the key is absent.
      value const& operator [](shim::string_view key) const;
      value const& operator [](std::size_t idx) const;

    private:

      /*----- Private Types -----*/

      using storage = shim::variant<
        std::string,
        bool,
        decimal_text,
        int64_t,
        array_type,
        mapping_type
      >;

      /*----- Private Lifecycle Functions -----*/

      explicit value(storage data);

      /*----- Private Members -----*/

      storage data;

  };

  struct kv {
    location loc;
    std::string key;
    value val;
  };

  bool operator ==(kv const& lhs, kv const& rhs);
  bool operator !=(kv const& lhs, kv const& rhs);

  using kv_list = std::vector<kv>;

  char const* to_string(value::type type) noexcept;

  // Debug rendering of a value, flow-style ("{a: 1, b: [true, \"1.5\"]}").
  std::string to_string(value const& val);
  std::ostream& operator <<(std::ostream& out, value const& val);

}

#endif
