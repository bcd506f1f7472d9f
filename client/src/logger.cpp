#include "clawbridge/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace clawbridge::client
{

    Logger::Logger(const LogOptions &options)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (options.console)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }
            if (options.file)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("clawbridge", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
            logger_->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace clawbridge::client
