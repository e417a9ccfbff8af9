#pragma once

#include "mux.hpp"

#include <memory>

#define TRELLIS_METHOD(name, str) \
    auto name( \
        std::string_view path, \
        handler fn, \
        std::vector<middleware> chain = {} \
    ) -> router& { \
        return handle(str, path, std::move(fn), std::move(chain)); \
    }

namespace trellis {
    /// Registers routes on a mux, wrapping each handler in the router's
    /// middleware chain.
    ///
    /// Middleware is bound when a route is registered: the route runs the
    /// chain as it was at that moment, in insertion order, followed by the
    /// route's own middleware and then the handler.
    class router {
        std::shared_ptr<trellis::mux> mux;
        std::vector<middleware> stack;

        router(
            std::shared_ptr<trellis::mux> mux,
            std::vector<middleware> chain
        );
    public:
        explicit router(std::vector<middleware> chain = {});

        auto any(
            std::string_view path,
            handler fn,
            std::vector<middleware> chain = {}
        ) -> router&;

        auto base_path() const noexcept -> std::string_view;

        auto append_path(std::string_view path) -> void;

        auto chain() const noexcept -> const std::vector<middleware>&;

        /// Wraps 'fn' in 'chain' (innermost) and then the router's own
        /// middleware (outermost).
        auto compose(
            handler fn,
            const std::vector<middleware>& chain = {}
        ) const -> handler;

        /// Calls 'fn' with a router sharing this router's mux and a copy of
        /// its current middleware.
        auto group(const std::function<void(router&)>& fn) -> void;

        /// Registers 'fn' for "METHOD path".
        auto handle(
            std::string_view method,
            std::string_view path,
            handler fn,
            std::vector<middleware> chain = {}
        ) -> router&;

        /// Registers 'fn' for 'path' and everything below it.
        auto mount(
            std::string_view path,
            handler fn,
            std::vector<middleware> chain = {}
        ) -> void;

        auto not_found(response_writer& writer, request& req) const -> void;

        /// Creates a sub-router with its own mux rooted at 'path' below this
        /// router's base path, lets 'fn' register its routes, and mounts it
        /// at 'path'. The sub-router starts with 'chain' as its middleware
        /// and inherits the not-found handler.
        auto route(
            std::string_view path,
            const std::function<void(router&)>& fn,
            std::vector<middleware> chain = {}
        ) -> router;

        auto serve(response_writer& writer, request& req) const -> void;

        auto set_base_path(std::string_view path) -> void;

        /// Sets the wrapper run around pattern resolution for every request
        /// that is not answered by the not-found handler.
        auto set_handler(middleware wrapper) -> void;

        auto set_not_found_handler(handler fn) -> void;

        /// Appends to the middleware chain. Routes registered earlier are
        /// not affected.
        template <typename... Middleware>
        auto use(Middleware&&... m) -> router& {
            (stack.emplace_back(std::forward<Middleware>(m)), ...);
            return *this;
        }

        TRELLIS_METHOD(del,     "DELETE")
        TRELLIS_METHOD(get,     "GET")
        TRELLIS_METHOD(head,    "HEAD")
        TRELLIS_METHOD(options, "OPTIONS")
        TRELLIS_METHOD(patch,   "PATCH")
        TRELLIS_METHOD(post,    "POST")
        TRELLIS_METHOD(put,     "PUT")
    };
}

#undef TRELLIS_METHOD
