#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "btoon/log/log_config.hpp"

namespace btoon::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace btoon::log

#define BTOON_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define BTOON_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define BTOON_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define BTOON_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define BTOON_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define BTOON_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
