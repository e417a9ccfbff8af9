#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace trellis {
    /// Joins path segments into a normalized absolute prefix.
    ///
    /// One leading and one trailing slash are stripped from every segment;
    /// empty and "/" segments are skipped. The result is either empty or
    /// starts with a slash and does not end with one.
    auto join(std::initializer_list<std::string_view> segments) -> std::string;

    /// Prefixes the path component of 'pattern' with 'root', keeping the
    /// method token (if any) separated by a single space.
    auto full_pattern(
        std::string_view root,
        std::string_view pattern
    ) -> std::string;
}
