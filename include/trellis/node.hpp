#pragma once

#include "error.hpp"

#include <fmt/format.h>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace trellis {
    enum class node_type {
        static_route,
        param,
        catch_all
    };

    struct segment {
        node_type type;
        std::string_view value;
    };

    /// Splits a pattern path into tree segments.
    ///
    /// "{name}" captures one segment, a trailing "{name...}" captures the
    /// rest of the path, and a trailing "{$}" matches only the path ending
    /// in a slash. Any other trailing slash makes the pattern match the
    /// whole subtree below it.
    auto parse_pattern_path(std::string_view path) -> std::vector<segment>;

    /// Splits a request path into its segments: "/a/b/" yields
    /// ["a", "b", ""].
    auto split_path(std::string_view path) -> std::vector<std::string_view>;

    template <typename T>
    struct match {
        T* value;
        std::vector<std::string_view> captures;

        /// False when a subtree pattern matched something below its root.
        bool exact;
    };

    template <typename T>
    class node {
        node_type type = node_type::static_route;
        std::string prefix;
        std::optional<T> value;
        std::vector<node> children;

        struct result {
            T* value;
            bool exact;
        };

        node(node_type type, std::string_view prefix) :
            type(type),
            prefix(prefix)
        {}

        auto child(const segment& seg) -> node& {
            auto it = children.begin();

            for (; it != children.end(); ++it) {
                if (it->type == seg.type) {
                    if (
                        seg.type != node_type::static_route ||
                        it->prefix == seg.value
                    ) return *it;
                }

                if (it->type > seg.type) break;
            }

            const auto prefix = seg.type == node_type::static_route ?
                seg.value : std::string_view();

            return *children.insert(it, node(seg.type, prefix));
        }

        template <typename Predicate>
        auto search(
            std::span<const std::string_view> segments,
            const char* end,
            std::vector<std::string_view>& captures,
            const Predicate& accept
        ) -> result {
            if (segments.empty()) {
                if (value && accept(*value)) return {&*value, true};
                return {nullptr, false};
            }

            const auto current = segments.front();
            const auto rest = segments.subspan(1);

            for (auto& child : children) {
                switch (child.type) {
                    case node_type::static_route:
                        if (child.prefix == current) {
                            auto found = child.search(
                                rest,
                                end,
                                captures,
                                accept
                            );
                            if (found.value) return found;
                        }
                        break;
                    case node_type::param: {
                        if (current.empty()) break;

                        captures.push_back(current);

                        auto found = child.search(rest, end, captures, accept);
                        if (found.value) return found;

                        captures.pop_back();
                        break;
                    }
                    case node_type::catch_all:
                        if (child.value && accept(*child.value)) {
                            const auto remainder = std::string_view(
                                current.data(),
                                static_cast<std::size_t>(end - current.data())
                            );

                            captures.push_back(remainder);
                            return {&*child.value, remainder.empty()};
                        }
                        break;
                }
            }

            return {nullptr, false};
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            int level
        ) const -> void {
            auto type = std::string_view();

            switch (this->type) {
                case node_type::static_route: type = ""; break;
                case node_type::param: type = "{}"; break;
                case node_type::catch_all: type = "{...}"; break;
            }

            const auto indent = level * 2;
            for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

            fmt::format_to(
                out,
                "/{}{} {}\n",
                prefix,
                type,
                value ? fmt::to_string(*value) : ""
            );

            for (const auto& child : children) child.format_to(out, level + 1);
        }
    public:
        node() = default;

        /// Returns the value slot for the given segments, creating the
        /// branch and a default value if they do not exist yet.
        auto insert(std::span<const segment> segments) -> T& {
            auto* current = this;

            for (const auto& seg : segments) current = &current->child(seg);

            if (!current->value) current->value.emplace();
            return *current->value;
        }

        /// Finds the most specific value matching 'path' for which 'accept'
        /// returns true. Literal segments are preferred over single-segment
        /// captures, which are preferred over subtree matches.
        template <typename Predicate>
        auto find(
            std::string_view path,
            const Predicate& accept
        ) -> std::optional<match<T>> {
            const auto segments = split_path(path);
            auto captures = std::vector<std::string_view>();

            const auto found = search(
                std::span<const std::string_view>(segments),
                path.data() + path.size(),
                captures,
                accept
            );

            if (!found.value) return std::nullopt;

            return match<T> {
                .value = found.value,
                .captures = std::move(captures),
                .exact = found.exact
            };
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            for (const auto& child : children) child.format_to(out, 0);

            return fmt::to_string(buffer);
        }
    };
}
