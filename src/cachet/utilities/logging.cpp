#include <cachet/utilities/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cachet {

namespace {

std::shared_ptr<spdlog::logger>
find_or_create_logger()
{
    auto logger = spdlog::get("cachet");
    if (!logger)
        logger = spdlog::stdout_color_mt("cachet");
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> const&
get_logger()
{
    static std::shared_ptr<spdlog::logger> const logger
        = find_or_create_logger();
    return logger;
}

} // namespace cachet
