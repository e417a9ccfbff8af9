#pragma once

#include "response.hpp"

namespace trellis {
    /// Middleware answering requests whose handler threw.
    ///
    /// An 'error_code' is sent as its status and message. Any other
    /// exception is logged and answered with a 500.
    auto recover() -> middleware;
}
