#pragma once

#include <string>
#include <unistd.h>

#include "lcr/log/logger.hpp"


namespace tickdb::tools {

// Level from a CLI string; color only when stderr is a terminal
inline void set_log_level(const std::string& log_level) {
    using namespace lcr::log;
    Logger::instance().set_level(parse_level(log_level));
    Logger::instance().enable_color(::isatty(STDERR_FILENO) != 0);
}

} // namespace tickdb::tools
