#pragma once

#include "serve_mux.hpp"

#include <initializer_list>

namespace trellis {
    /// Owns a dispatcher together with the root path prefixed to every
    /// pattern it registers, an optional global wrapper and an optional
    /// not-found handler.
    class mux {
        serve_mux dispatcher;
        std::string root;
        middleware global;
        handler not_found;
    public:
        mux() = default;

        explicit mux(std::initializer_list<std::string_view> paths);

        mux(const mux&) = delete;

        mux(mux&&) = delete;

        auto operator=(const mux&) -> mux& = delete;

        auto operator=(mux&&) -> mux& = delete;

        auto append_path(std::string_view path) -> void;

        auto full_pattern(std::string_view pattern) const -> std::string;

        /// Registers 'fn' for the prefixed 'pattern'. A pattern containing
        /// hyphens is also registered with underscores in their place, and
        /// one containing only underscores also with hyphens. Wildcard
        /// names are never rewritten.
        auto handle(std::string_view pattern, handler fn) -> void;

        auto not_found_handler() const -> const handler&;

        auto resolve(const request& req) -> resolution;

        auto root_path() const noexcept -> std::string_view;

        /// Dispatch entry point.
        ///
        /// Requests that match no pattern go to the not-found handler, if
        /// one is set, without running the global wrapper. Everything else
        /// runs through the global wrapper, if set, and then the
        /// dispatcher.
        auto serve(response_writer& writer, request& req) -> void;

        auto set_global_handler(middleware wrapper) -> void;

        auto set_not_found_handler(handler fn) -> void;

        auto set_root_path(std::string_view path) -> void;

        auto to_string() const -> std::string;
    };
}
