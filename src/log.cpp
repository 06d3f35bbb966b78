#include "log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging(const std::string& level)
{
    auto stderr_logger = spdlog::get("zoomscope");
    if (!stderr_logger)
        stderr_logger = spdlog::stderr_color_mt("zoomscope");
    spdlog::set_default_logger(stderr_logger);

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off")
        lvl = spdlog::level::info;
    spdlog::set_level(lvl);
    spdlog::set_pattern("[%^%l%$ +%o] %v");
}
