#include <trellis/interceptor.hpp>
#include <trellis/mux.hpp>
#include <trellis/path.hpp>

#include <timber/timber>

namespace {
    /// Replaces 'from' with 'to' everywhere except inside wildcards, so
    /// that capture names keep their spelling.
    auto replace_literal(
        std::string string,
        char from,
        char to
    ) -> std::string {
        auto depth = 0;

        for (auto& c : string) {
            if (c == '{') ++depth;
            else if (c == '}') {
                if (depth > 0) --depth;
            }
            else if (depth == 0 && c == from) c = to;
        }

        return string;
    }
}

namespace trellis {
    mux::mux(std::initializer_list<std::string_view> paths) :
        root(join(paths))
    {}

    auto mux::append_path(std::string_view path) -> void {
        root = join({root, path});
    }

    auto mux::full_pattern(std::string_view pattern) const -> std::string {
        return trellis::full_pattern(root, pattern);
    }

    auto mux::handle(std::string_view pattern, handler fn) -> void {
        const auto full = full_pattern(pattern);

        TIMBER_DEBUG("Handle {}", full);
        dispatcher.handle(full, fn);

        auto alias = replace_literal(full, '-', '_');
        if (alias == full) alias = replace_literal(full, '_', '-');

        if (alias != full) {
            TIMBER_DEBUG("Handle {} (alias of {})", alias, full);
            dispatcher.handle(alias, std::move(fn));
        }
    }

    auto mux::not_found_handler() const -> const handler& {
        return not_found;
    }

    auto mux::resolve(const request& req) -> resolution {
        return dispatcher.resolve(req);
    }

    auto mux::root_path() const noexcept -> std::string_view {
        return root;
    }

    auto mux::serve(response_writer& writer, request& req) -> void {
        TIMBER_TRACE("Handling path {}", req.path);

        auto storage = std::optional<status_interceptor>();
        auto& intercepted = intercept(writer, req.path, storage);

        if (not_found && dispatcher.resolve(req).pattern.empty()) {
            not_found(intercepted, req);
            return;
        }

        if (global) {
            auto next = handler([this](response_writer& w, request& r) {
                dispatcher.serve(w, r);
            });

            global(std::move(next))(intercepted, req);
            return;
        }

        dispatcher.serve(intercepted, req);
    }

    auto mux::set_global_handler(middleware wrapper) -> void {
        global = std::move(wrapper);
    }

    auto mux::set_not_found_handler(handler fn) -> void {
        not_found = std::move(fn);
    }

    auto mux::set_root_path(std::string_view path) -> void {
        root = path;
    }

    auto mux::to_string() const -> std::string {
        return dispatcher.to_string();
    }
}
