#include <trellis/error.hpp>
#include <trellis/recover.hpp>
#include <trellis/request.hpp>
#include <trellis/status.hpp>

#include <timber/timber>

namespace {
    auto send(
        trellis::response_writer& writer,
        int code,
        std::string_view message
    ) -> void {
        auto& headers = writer.headers();

        headers.set("content-type", "text/plain; charset=utf-8");
        headers.set("content-length", std::to_string(message.size()));

        writer.write_header(code);
        writer.write(message);
    }
}

namespace trellis {
    auto recover() -> middleware {
        return [](handler next) -> handler {
            return [next = std::move(next)](
                response_writer& writer,
                request& req
            ) {
                try {
                    next(writer, req);
                }
                catch (const error_code& ex) {
                    TIMBER_DEBUG(
                        "{} {}, Status: {} ({})",
                        req.method,
                        req.path,
                        ex.code(),
                        ex.what()
                    );

                    send(writer, ex.code(), ex.what());
                }
                catch (const std::exception& ex) {
                    TIMBER_ERROR(
                        "{} {}, Status: 500 ({})",
                        req.method,
                        req.path,
                        ex.what()
                    );

                    send(
                        writer,
                        status::internal_server_error,
                        status::text(status::internal_server_error)
                    );
                }
            };
        };
    }
}
