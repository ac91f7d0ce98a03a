#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace extraction_eval {

/// @brief Retrieve the current logger.
/// @return A const reference to the current logger object.
spdlog::logger& logger();

/// @brief Setup a logger object to be used by the library.
/// Calling this function with other function calls can be used to redirect
/// the output of the engine (e.g. into a file sink from the command line).
/// @param logger New logger object to be used. Ownership is shared.
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace extraction_eval
