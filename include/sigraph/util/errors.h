#ifndef SIGRAPH_UTIL_ERRORS
#define SIGRAPH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sigraph {

    /**
     * Base of the errors raised by the engine itself. Errors thrown by user compute functions, reaction bodies or
     * subscribers are never wrapped, they reach the triggering call site unchanged.
     */
    struct ReactiveError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A reaction kept re-triggering itself past ContextSettings::max_reaction_reruns.
     */
    struct ReactionCycleError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    /**
     * A NamedCollection validator rejected a value.
     */
    struct ValidationError : ReactiveError {
        using ReactiveError::ReactiveError;
    };

    template<typename Error = ReactiveError, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] void throw_error(Ts &&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = ReactiveError>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = ReactiveError, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace sigraph

#endif // SIGRAPH_UTIL_ERRORS
