#include <trellis/router.hpp>
#include <trellis/path.hpp>
#include <trellis/status.hpp>

#include <nlohmann/json.hpp>

namespace trellis {
    router::router(std::vector<middleware> chain) :
        router(std::make_shared<trellis::mux>(), std::move(chain))
    {}

    router::router(
        std::shared_ptr<trellis::mux> mux,
        std::vector<middleware> chain
    ) :
        mux(std::move(mux)),
        stack(std::move(chain))
    {}

    auto router::any(
        std::string_view path,
        handler fn,
        std::vector<middleware> chain
    ) -> router& {
        mux->handle(path, compose(std::move(fn), chain));
        return *this;
    }

    auto router::append_path(std::string_view path) -> void {
        mux->append_path(path);
    }

    auto router::base_path() const noexcept -> std::string_view {
        return mux->root_path();
    }

    auto router::chain() const noexcept -> const std::vector<middleware>& {
        return stack;
    }

    auto router::compose(
        handler fn,
        const std::vector<middleware>& chain
    ) const -> handler {
        auto result = std::move(fn);

        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            result = (*it)(std::move(result));
        }

        for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
            result = (*it)(std::move(result));
        }

        return result;
    }

    auto router::group(const std::function<void(router&)>& fn) -> void {
        auto child = router(mux, stack);
        fn(child);
    }

    auto router::handle(
        std::string_view method,
        std::string_view path,
        handler fn,
        std::vector<middleware> chain
    ) -> router& {
        mux->handle(
            fmt::format("{} {}", method, path),
            compose(std::move(fn), chain)
        );

        return *this;
    }

    auto router::mount(
        std::string_view path,
        handler fn,
        std::vector<middleware> chain
    ) -> void {
        if (path.ends_with('/')) path.remove_suffix(1);

        mux->handle(fmt::format("{}/", path), compose(std::move(fn), chain));
    }

    auto router::not_found(
        response_writer& writer,
        request& req
    ) const -> void {
        if (const auto& fn = mux->not_found_handler()) {
            fn(writer, req);
            return;
        }

        const auto body = nlohmann::json({{"error", "Not Found"}}).dump();

        writer.headers().set("content-type", "application/json");
        writer.headers().set("content-length", std::to_string(body.size()));
        writer.write_header(status::not_found);
        writer.write(body);
    }

    auto router::route(
        std::string_view path,
        const std::function<void(router&)>& fn,
        std::vector<middleware> chain
    ) -> router {
        auto sub = std::make_shared<trellis::mux>();

        sub->set_root_path(join({mux->root_path(), path}));
        sub->set_not_found_handler(mux->not_found_handler());

        auto child = router(sub, std::move(chain));
        if (fn) fn(child);

        mount(path, [sub](response_writer& writer, request& req) {
            sub->serve(writer, req);
        });

        return child;
    }

    auto router::serve(response_writer& writer, request& req) const -> void {
        mux->serve(writer, req);
    }

    auto router::set_base_path(std::string_view path) -> void {
        mux->set_root_path(path);
    }

    auto router::set_handler(middleware wrapper) -> void {
        mux->set_global_handler(std::move(wrapper));
    }

    auto router::set_not_found_handler(handler fn) -> void {
        mux->set_not_found_handler(std::move(fn));
    }
}
