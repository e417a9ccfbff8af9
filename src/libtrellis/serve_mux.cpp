#include <trellis/serve_mux.hpp>
#include <trellis/status.hpp>

#include <fmt/ranges.h>
#include <set>
#include <timber/timber>

using namespace std::literals;

namespace {
    constexpr auto blank = " \t"sv;

    auto write_error(
        trellis::response_writer& writer,
        int code,
        std::string_view message
    ) -> void {
        auto& headers = writer.headers();

        headers.erase("content-length");
        headers.set("content-type", "text/plain; charset=utf-8");
        headers.set("x-content-type-options", "nosniff");

        writer.write_header(code);
        writer.write(fmt::format("{}\n", message));
    }

    auto not_found(
        trellis::response_writer& writer,
        trellis::request&
    ) -> void {
        write_error(writer, trellis::status::not_found, "404 page not found");
    }

    auto method_not_allowed(std::string allowed) -> trellis::handler {
        return [allowed = std::move(allowed)](
            trellis::response_writer& writer,
            trellis::request&
        ) {
            writer.headers().set("allow", allowed);

            write_error(
                writer,
                trellis::status::method_not_allowed,
                trellis::status::text(trellis::status::method_not_allowed)
            );
        };
    }

    auto redirect(std::string location) -> trellis::handler {
        return [location = std::move(location)](
            trellis::response_writer& writer,
            trellis::request& req
        ) {
            auto& headers = writer.headers();
            headers.set("location", location);

            if (req.method == "GET" || req.method == "HEAD") {
                headers.set("content-type", "text/html; charset=utf-8");
            }

            writer.write_header(trellis::status::moved_permanently);

            if (req.method == "GET") {
                writer.write(fmt::format(
                    "<a href=\"{}\">{}</a>.\n\n",
                    location,
                    trellis::status::text(trellis::status::moved_permanently)
                ));
            }
        };
    }
}

namespace trellis {
    auto serve_mux::allowed(std::string_view path) -> std::string {
        auto methods = std::set<std::string_view>();

        // Visits every route matching the path; nothing is accepted.
        const auto collect = [&methods](const route& r) {
            for (const auto& entry : r.methods) methods.insert(entry.first);
            return false;
        };

        root.find(path, collect);

        // A request that could be redirected is allowed what the slashed
        // path allows.
        if (!path.ends_with('/')) root.find(fmt::format("{}/", path), collect);

        if (methods.contains("GET")) methods.insert("HEAD");

        return fmt::format("{}", fmt::join(methods, ", "));
    }

    auto serve_mux::find(
        std::string_view method,
        std::string_view path
    ) -> std::optional<found> {
        const auto lookup = [this, path](
            std::string_view key
        ) -> std::optional<found> {
            auto result = root.find(path, [key](const route& r) {
                return r.methods.contains(key);
            });

            if (!result) return std::nullopt;

            auto* const target = &result->value->methods.find(key)->second;
            return found {target, std::move(*result)};
        };

        if (auto result = lookup(method)) return result;

        if (method == "HEAD") {
            if (auto result = lookup("GET")) return result;
        }

        auto result = root.find(path, [](const route& r) {
            return r.any.has_value();
        });

        if (!result) return std::nullopt;

        auto* const target = &*result->value->any;
        return found {target, std::move(*result)};
    }

    auto serve_mux::handle(std::string_view pattern, handler fn) -> void {
        if (!fn) throw error("nil handler for pattern '{}'", pattern);

        auto method = std::string_view();
        auto path = pattern;

        const auto delim = pattern.find_first_of(blank);
        if (delim != std::string_view::npos) {
            method = pattern.substr(0, delim);
            path = pattern.substr(delim);

            const auto start = path.find_first_not_of(blank);
            path = start == std::string_view::npos ?
                std::string_view() : path.substr(start);
        }

        const auto segments = parse_pattern_path(path);

        auto names = std::vector<std::string>();
        for (const auto& seg : segments) {
            if (seg.type != node_type::static_route) {
                names.emplace_back(seg.value);
            }
        }

        auto& entry = root.insert(segments);
        auto target = endpoint {
            .pattern = std::string(pattern),
            .names = std::move(names),
            .fn = std::move(fn)
        };

        if (method.empty()) {
            if (entry.any) {
                TIMBER_DEBUG(
                    "Pattern '{}' replaces '{}'",
                    pattern,
                    entry.any->pattern
                );
            }

            entry.any = std::move(target);
            return;
        }

        const auto existing = entry.methods.find(method);
        if (existing != entry.methods.end()) {
            TIMBER_DEBUG(
                "Pattern '{}' replaces '{}'",
                pattern,
                existing->second.pattern
            );

            existing->second = std::move(target);
            return;
        }

        entry.methods.emplace(std::string(method), std::move(target));
    }

    auto serve_mux::resolve(const request& req) -> resolution {
        const auto path = req.path.empty() ?
            "/"sv : std::string_view(req.path);

        auto result = find(req.method, path);

        if ((!result || !result->result.exact) && !path.ends_with('/')) {
            auto slashed = fmt::format("{}/", path);
            const auto redirected = find(req.method, slashed);

            if (redirected && redirected->result.exact) {
                auto location = req.query.empty() ?
                    slashed : fmt::format("{}?{}", slashed, req.query);

                return resolution {
                    .fn = redirect(std::move(location)),
                    .pattern = std::move(slashed)
                };
            }
        }

        if (result) {
            const auto& target = *result->target;
            const auto& captures = result->result.captures;

            auto params = std::unordered_map<std::string, std::string>();

            for (std::size_t i = 0; i < target.names.size(); ++i) {
                if (target.names[i].empty() || i >= captures.size()) continue;
                params.insert_or_assign(
                    target.names[i],
                    std::string(captures[i])
                );
            }

            return resolution {
                .fn = target.fn,
                .pattern = target.pattern,
                .params = std::move(params)
            };
        }

        auto methods = allowed(path);
        if (!methods.empty()) {
            return resolution {.fn = method_not_allowed(std::move(methods))};
        }

        return resolution {.fn = not_found};
    }

    auto serve_mux::serve(response_writer& writer, request& req) -> void {
        auto result = resolve(req);

        req.pattern = std::move(result.pattern);
        req.params = std::move(result.params);

        result.fn(writer, req);
    }

    auto serve_mux::to_string() const -> std::string {
        return root.to_string();
    }
}
