#include <trellis/status.hpp>

namespace trellis::status {
    auto text(int code) noexcept -> std::string_view {
        switch (code) {
            case ok: return "OK";
            case created: return "Created";
            case no_content: return "No Content";
            case moved_permanently: return "Moved Permanently";
            case found: return "Found";
            case see_other: return "See Other";
            case temporary_redirect: return "Temporary Redirect";
            case permanent_redirect: return "Permanent Redirect";
            case bad_request: return "Bad Request";
            case unauthorized: return "Unauthorized";
            case forbidden: return "Forbidden";
            case not_found: return "Not Found";
            case method_not_allowed: return "Method Not Allowed";
            case internal_server_error: return "Internal Server Error";
            default: return "";
        }
    }
}
