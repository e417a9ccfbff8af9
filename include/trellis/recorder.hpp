#pragma once

#include "response.hpp"

#include <string>

namespace trellis {
    /// A response writer that keeps everything in memory.
    class response_recorder : public response_writer, public flusher {
        header_map header_fields;
    public:
        int code = 200;
        std::string body;
        bool flushed = false;
        bool wrote_header = false;

        auto as_flusher() -> flusher* override;

        auto flush() -> void override;

        auto headers() -> header_map& override;

        auto write(std::string_view data) -> std::size_t override;

        /// Records the first status written; later calls are ignored.
        auto write_header(int code) -> void override;
    };
}
