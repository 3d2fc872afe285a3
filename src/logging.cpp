#include "logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace nflz
{

void SetupLogging(const Options &options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!options.log_file.empty())
    {
        // 追加写入，不覆盖之前的日志
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false));
    }

    auto logger = std::make_shared<spdlog::logger>("nflz", sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
}

} // namespace nflz
