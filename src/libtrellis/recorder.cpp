#include <trellis/recorder.hpp>

#include <timber/timber>

namespace trellis {
    auto response_recorder::as_flusher() -> flusher* { return this; }

    auto response_recorder::flush() -> void {
        if (!wrote_header) write_header(200);
        flushed = true;
    }

    auto response_recorder::headers() -> header_map& {
        return header_fields;
    }

    auto response_recorder::write(std::string_view data) -> std::size_t {
        if (!wrote_header) write_header(200);

        body.append(data);
        return data.size();
    }

    auto response_recorder::write_header(int code) -> void {
        if (wrote_header) {
            TIMBER_DEBUG(
                "Superfluous write_header({}) after status {}",
                code,
                this->code
            );
            return;
        }

        this->code = code;
        wrote_header = true;
    }
}
