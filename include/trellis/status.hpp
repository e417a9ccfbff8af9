#pragma once

#include <string_view>

namespace trellis::status {
    constexpr auto ok = 200;
    constexpr auto created = 201;
    constexpr auto no_content = 204;
    constexpr auto moved_permanently = 301;
    constexpr auto found = 302;
    constexpr auto see_other = 303;
    constexpr auto temporary_redirect = 307;
    constexpr auto permanent_redirect = 308;
    constexpr auto bad_request = 400;
    constexpr auto unauthorized = 401;
    constexpr auto forbidden = 403;
    constexpr auto not_found = 404;
    constexpr auto method_not_allowed = 405;
    constexpr auto internal_server_error = 500;

    auto text(int code) noexcept -> std::string_view;
}
