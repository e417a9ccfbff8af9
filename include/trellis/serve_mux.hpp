#pragma once

#include "node.hpp"
#include "request.hpp"
#include "response.hpp"

#include <map>

namespace trellis {
    struct resolution {
        handler fn;

        /// The pattern that matched, the redirect target, or an empty
        /// string when nothing matched.
        std::string pattern;

        std::unordered_map<std::string, std::string> params;
    };

    /// Multiplexes requests by method and path pattern.
    ///
    /// Patterns have the form "[METHOD ]PATH". A pattern without a method
    /// matches every method, and a GET pattern also matches HEAD requests.
    /// A request for a subtree root without its trailing slash is
    /// redirected to the slashed path with a 301.
    class serve_mux {
    public:
        struct endpoint {
            std::string pattern;
            std::vector<std::string> names;
            handler fn;
        };

        struct route {
            std::map<std::string, endpoint, std::less<>> methods;
            std::optional<endpoint> any;
        };
    private:
        struct found {
            endpoint* target;
            match<route> result;
        };

        node<route> root;

        auto allowed(std::string_view path) -> std::string;

        auto find(
            std::string_view method,
            std::string_view path
        ) -> std::optional<found>;
    public:
        serve_mux() = default;

        serve_mux(const serve_mux&) = delete;

        serve_mux(serve_mux&&) = default;

        auto operator=(const serve_mux&) -> serve_mux& = delete;

        auto operator=(serve_mux&&) -> serve_mux& = default;

        /// Registers 'fn' for 'pattern'. Registering the same method and
        /// path again replaces the previous handler.
        auto handle(std::string_view pattern, handler fn) -> void;

        /// Determines the handler for 'req' without invoking it.
        auto resolve(const request& req) -> resolution;

        auto serve(response_writer& writer, request& req) -> void;

        auto to_string() const -> std::string;
    };
}

template <>
struct fmt::formatter<trellis::serve_mux::route> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(
        const trellis::serve_mux::route& route,
        FormatContext& ctx
    ) const {
        auto buffer = memory_buffer();
        auto out = std::back_inserter(buffer);

        auto first = true;

        for (const auto& entry : route.methods) {
            fmt::format_to(out, "{}{}", first ? "" : ", ", entry.first);
            first = false;
        }

        if (route.any) fmt::format_to(out, "{}*", first ? "" : ", ");

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
