#include <trellis/error.hpp>
#include <trellis/interceptor.hpp>
#include <trellis/status.hpp>

#include <timber/timber>

namespace trellis {
    status_interceptor::status_interceptor(
        response_writer& writer,
        std::string_view path
    ) :
        writer(&writer),
        original_path(path)
    {}

    auto status_interceptor::as_flusher() -> flusher* { return this; }

    auto status_interceptor::as_hijacker() -> hijacker* { return this; }

    auto status_interceptor::as_interceptor() -> status_interceptor* {
        return this;
    }

    auto status_interceptor::as_pusher() -> pusher* { return this; }

    auto status_interceptor::flush() -> void {
        if (auto* const f = writer->as_flusher()) f->flush();
    }

    auto status_interceptor::headers() -> header_map& {
        return writer->headers();
    }

    auto status_interceptor::hijack() -> std::unique_ptr<connection> {
        if (auto* const h = writer->as_hijacker()) return h->hijack();
        throw not_supported("hijack");
    }

    auto status_interceptor::path() const noexcept -> std::string_view {
        return original_path;
    }

    auto status_interceptor::push(
        std::string_view target,
        const push_options& options
    ) -> void {
        if (auto* const p = writer->as_pusher()) {
            p->push(target, options);
            return;
        }

        throw not_supported("push");
    }

    auto status_interceptor::status() const noexcept -> int {
        return committed;
    }

    auto status_interceptor::unwrap() noexcept -> response_writer& {
        return *writer;
    }

    auto status_interceptor::write(std::string_view data) -> std::size_t {
        return writer->write(data);
    }

    auto status_interceptor::write_header(int code) -> void {
        if (
            code == status::moved_permanently &&
            writer->headers().get("location") == original_path + "/"
        ) {
            TIMBER_DEBUG(
                "Rewriting trailing slash redirect for {} to {}",
                original_path,
                status::temporary_redirect
            );

            code = status::temporary_redirect;
        }

        committed = code;
        writer->write_header(code);
    }

    auto intercept(
        response_writer& writer,
        std::string_view path,
        std::optional<status_interceptor>& storage
    ) -> status_interceptor& {
        if (auto* const existing = writer.as_interceptor()) return *existing;
        return storage.emplace(writer, path);
    }
}
