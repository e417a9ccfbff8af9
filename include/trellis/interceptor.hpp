#pragma once

#include "response.hpp"

#include <optional>
#include <string>

namespace trellis {
    /// Wraps a response writer for the duration of one request.
    ///
    /// Everything is forwarded to the wrapped writer except a 301 whose
    /// 'Location' is the request path plus a trailing slash: that redirect
    /// is committed as a 307 so the client repeats the original method.
    class status_interceptor final :
        public response_writer,
        public flusher,
        public hijacker,
        public pusher
    {
        response_writer* writer;
        std::string original_path;
        int committed = 0;
    public:
        status_interceptor(response_writer& writer, std::string_view path);

        status_interceptor(const status_interceptor&) = delete;

        status_interceptor(status_interceptor&&) = delete;

        auto operator=(const status_interceptor&) -> status_interceptor& =
            delete;

        auto operator=(status_interceptor&&) -> status_interceptor& = delete;

        auto as_flusher() -> flusher* override;

        auto as_hijacker() -> hijacker* override;

        auto as_interceptor() -> status_interceptor* override;

        auto as_pusher() -> pusher* override;

        /// Forwards to the wrapped writer if it can flush; does nothing
        /// otherwise.
        auto flush() -> void override;

        auto headers() -> header_map& override;

        auto hijack() -> std::unique_ptr<connection> override;

        auto path() const noexcept -> std::string_view;

        auto push(
            std::string_view target,
            const push_options& options
        ) -> void override;

        /// The status committed through this wrapper, or 0.
        auto status() const noexcept -> int;

        auto unwrap() noexcept -> response_writer&;

        auto write(std::string_view data) -> std::size_t override;

        auto write_header(int code) -> void override;
    };

    /// Returns 'writer' itself if it is already intercepted. Otherwise
    /// constructs an interceptor in 'storage' and returns it.
    auto intercept(
        response_writer& writer,
        std::string_view path,
        std::optional<status_interceptor>& storage
    ) -> status_interceptor&;
}
