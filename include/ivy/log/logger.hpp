#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "ivy/log/log_config.hpp"

namespace ivy::log {

class Logger {
public:
    static void init(const LogConfig& config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace ivy::log

#define IVY_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define IVY_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define IVY_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define IVY_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define IVY_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define IVY_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
