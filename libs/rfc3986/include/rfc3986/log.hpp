#pragma once

#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

namespace rfc3986
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - RFC3986_LOG_LEVEL
 *  - RFC3986_LOG_FILE
 *  - RFC3986_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @return Error object of type error_t to throw.
 */
template<typename error_t = std::runtime_error>
error_t logRuntimeError(std::string const& what) {
    log().error(what);
    return error_t(what);
}

}
