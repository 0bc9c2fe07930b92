#include "logging.hpp"
#include <glib/gstdio.h>
#include <glibmm.h>
#include <memory>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

void Logging::init(const std::string &logFile, bool verbose)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    std::string fileError;

    if (!logFile.empty())
    {
        std::string dir = Glib::path_get_dirname(logFile);
        if (g_mkdir_with_parents(dir.c_str(), 0700) == 0)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, MAX_LOG_SIZE, MAX_LOG_FILES));
            }
            catch (const spdlog::spdlog_ex &e)
            {
                fileError = e.what();
            }
        }
        else
        {
            fileError = "cannot create " + dir;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("flowstate", sinks.begin(), sinks.end());
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!fileError.empty())
        spdlog::warn("[Logging] File logging disabled: {}", fileError);
}

void Logging::shutdown()
{
    spdlog::shutdown();
}
