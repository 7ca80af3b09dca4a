#include "phasegraph/common/logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace phasegraph
{

namespace
{

LoggerPtr make_logger(const std::string& name, spdlog::sink_ptr sink, spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern(log_pattern);
    logger->set_level(level);
    return logger;
}

} // namespace

LoggerPtr make_stream_logger(const std::string& name, std::ostream& sink, spdlog::level::level_enum level)
{
    return make_logger(name, std::make_shared<spdlog::sinks::ostream_sink_mt>(sink, true), level);
}

LoggerPtr make_console_logger(const std::string& name, spdlog::level::level_enum level)
{
    return make_logger(name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), level);
}

LoggerPtr make_null_logger()
{
    return make_logger("null", std::make_shared<spdlog::sinks::null_sink_mt>(), spdlog::level::off);
}

} // namespace phasegraph
