#include <trellis/path.hpp>

#include <fmt/format.h>

namespace {
    constexpr auto blank = std::string_view(" \t");
}

namespace trellis {
    auto join(std::initializer_list<std::string_view> segments) -> std::string {
        auto result = std::string();

        for (auto segment : segments) {
            if (segment.empty() || segment == "/") continue;

            if (segment.starts_with('/')) segment.remove_prefix(1);
            if (segment.ends_with('/')) segment.remove_suffix(1);

            result.push_back('/');
            result.append(segment);
        }

        return result;
    }

    auto full_pattern(
        std::string_view root,
        std::string_view pattern
    ) -> std::string {
        if (root.empty()) return std::string(pattern);

        const auto delim = pattern.find_first_of(blank);
        if (delim == std::string_view::npos) {
            return fmt::format("{}{}", root, pattern);
        }

        const auto method = pattern.substr(0, delim);
        auto path = pattern.substr(delim);

        const auto start = path.find_first_not_of(blank);
        path = start == std::string_view::npos ?
            std::string_view() : path.substr(start);

        return fmt::format("{} {}{}", method, root, path);
    }
}
