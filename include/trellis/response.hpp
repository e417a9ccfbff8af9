#pragma once

#include "header_map.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <span>

namespace trellis {
    struct request;
    class response_writer;
    class status_interceptor;

    using handler = std::function<void(response_writer&, request&)>;
    using middleware = std::function<handler(handler)>;

    /// A raw, bidirectional byte stream taken over from the transport.
    class connection {
    public:
        virtual ~connection() = default;

        virtual auto close() -> void = 0;

        virtual auto read(std::span<std::byte> buffer) -> std::size_t = 0;

        virtual auto write(std::span<const std::byte> data) -> std::size_t = 0;
    };

    struct flusher {
        virtual ~flusher() = default;

        virtual auto flush() -> void = 0;
    };

    struct hijacker {
        virtual ~hijacker() = default;

        /// Takes over the underlying connection. The transport no longer
        /// manages it afterwards.
        virtual auto hijack() -> std::unique_ptr<connection> = 0;
    };

    struct push_options {
        std::string method = "GET";
        header_map headers;
    };

    struct pusher {
        virtual ~pusher() = default;

        virtual auto push(
            std::string_view target,
            const push_options& options
        ) -> void = 0;
    };

    class response_writer {
    public:
        virtual ~response_writer() = default;

        virtual auto headers() -> header_map& = 0;

        /// Writes body data, committing a 200 status first if no status was
        /// written yet.
        virtual auto write(std::string_view data) -> std::size_t = 0;

        virtual auto write_header(int code) -> void = 0;

        // Optional capabilities. A null result means the writer does not
        // support the operation.

        virtual auto as_flusher() -> flusher* { return nullptr; }

        virtual auto as_hijacker() -> hijacker* { return nullptr; }

        virtual auto as_pusher() -> pusher* { return nullptr; }

        virtual auto as_interceptor() -> status_interceptor* {
            return nullptr;
        }
    };
}
