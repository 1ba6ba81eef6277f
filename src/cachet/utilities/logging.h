#ifndef CACHET_UTILITIES_LOGGING_H
#define CACHET_UTILITIES_LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>

namespace cachet {

// Get the logger that cachet writes to.
//
// If the host application has registered a spdlog logger named "cachet"
// before the first call, that one is used. Otherwise, a colored stdout logger
// is created and registered under that name.
//
std::shared_ptr<spdlog::logger> const&
get_logger();

} // namespace cachet

#endif
