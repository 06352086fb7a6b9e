#ifndef CONCORD_SHIM_H
#define CONCORD_SHIM_H

// Make sure we have a fallback for compilers that don't support attributes at all.
#ifndef __has_cpp_attribute
#define __has_cpp_attribute(name) 0
#endif

// Figure out how to declare things [[nodiscard]]
#if __has_cpp_attribute(nodiscard)
#define CONCORD_NODISCARD [[nodiscard]]
#elif __has_cpp_attribute(gnu::warn_unused_result)
#define CONCORD_NODISCARD [[gnu::warn_unused_result]]
#else
#define CONCORD_NODISCARD
#endif

/*----- System Includes -----*/

#include <utility>
#include <variant>
#include <optional>
#include <string_view>
#include <type_traits>

namespace concord {
  namespace shim {

    // Pull in names of types.
    using std::optional;
    using std::variant;
    using std::string_view;

    // Pull in constants.
    static inline constexpr auto nullopt = std::nullopt;

    // Pull in non-member helpers.
    using std::visit;
    using std::get_if;
    using std::holds_alternative;

    // Define a way to compose lambdas.
    template <class... Ls>
    struct compose : Ls... {
      using Ls::operator ()...;
    };
    template <class... Ls>
    compose(Ls...) -> compose<Ls...>;

    template <class... Ls>
    auto compose_together(Ls&&... lambdas) {
      return compose<std::decay_t<Ls>...> {std::forward<Ls>(lambdas)...};
    }

  }
}

#endif
