#include <patchwork/core/logging.hpp>

#include <mutex>
#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>

#include <patchwork/core/exception.hpp>

namespace patchwork {

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> lock(creation_mutex);

    // Create and register the logger.
    auto logger = spdlog::get("patchwork");
    if (!logger)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(
            std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
        logger = std::make_shared<spdlog::logger>(
            "patchwork", begin(sinks), end(sinks));
        logger->set_level(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
    return logger;
}

void
set_log_level(string const& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps anything it doesn't recognize to 'off'.
    if (parsed == spdlog::level::off && level != "off")
    {
        PATCHWORK_THROW(
            invalid_enum_string() << enum_id_info("log_level")
                                  << enum_string_info(level));
    }
    get_logger()->set_level(parsed);
}

} // namespace patchwork
