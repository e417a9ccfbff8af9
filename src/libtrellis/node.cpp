#include <trellis/node.hpp>

#include <cctype>

namespace {
    auto is_identifier(std::string_view name) -> bool {
        if (name.empty()) return false;

        const auto word = [](char c) {
            return c == '_' || std::isalnum(static_cast<unsigned char>(c));
        };

        if (std::isdigit(static_cast<unsigned char>(name.front()))) {
            return false;
        }

        for (const auto c : name) {
            if (!word(c)) return false;
        }

        return true;
    }
}

namespace trellis {
    auto parse_pattern_path(std::string_view path) -> std::vector<segment> {
        if (!path.starts_with('/')) {
            throw error("pattern path '{}' must begin with '/'", path);
        }

        auto result = std::vector<segment>();
        auto anchored = false;

        const auto parts = split_path(path);

        for (std::size_t i = 0; i < parts.size(); ++i) {
            const auto part = parts[i];
            const auto last = i == parts.size() - 1;

            if (part.find_first_of("{}") == std::string_view::npos) {
                result.push_back({node_type::static_route, part});
                continue;
            }

            if (!part.starts_with('{') || !part.ends_with('}')) {
                throw error(
                    "bad wildcard segment '{}' in pattern path '{}': "
                    "wildcards must span a whole segment",
                    part,
                    path
                );
            }

            auto name = part.substr(1, part.size() - 2);

            if (name == "$") {
                if (!last) {
                    throw error("{{$}} not at end of pattern path '{}'", path);
                }

                result.push_back({node_type::static_route, {}});
                anchored = true;
                continue;
            }

            auto type = node_type::param;

            if (name.ends_with("...")) {
                if (!last) {
                    throw error(
                        "'{}' not at end of pattern path '{}'",
                        part,
                        path
                    );
                }

                name.remove_suffix(3);
                type = node_type::catch_all;
            }

            if (name.empty()) {
                throw error("empty wildcard name in pattern path '{}'", path);
            }

            if (!is_identifier(name)) {
                throw error(
                    "bad wildcard name '{}' in pattern path '{}'",
                    name,
                    path
                );
            }

            result.push_back({type, name});
        }

        if (!anchored && result.back().type == node_type::static_route &&
            result.back().value.empty()
        ) {
            result.back().type = node_type::catch_all;
        }

        return result;
    }

    auto split_path(std::string_view path) -> std::vector<std::string_view> {
        auto result = std::vector<std::string_view>();

        if (path.starts_with('/')) path.remove_prefix(1);
        else if (path.empty()) return result;

        while (true) {
            const auto slash = path.find('/');

            if (slash == std::string_view::npos) {
                result.push_back(path);
                break;
            }

            result.push_back(path.substr(0, slash));
            path.remove_prefix(slash + 1);
        }

        return result;
    }
}
