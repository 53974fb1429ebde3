#define __PROJECT__ "FLEETCMD"

#include "logger.hh"
#include <rd_utils/utils/log.hh>

namespace fleetcmd::utils {

    Logger::~Logger () {}

    void NullLogger::debug (const std::string &) {}
    void NullLogger::info (const std::string &) {}
    void NullLogger::warn (const std::string &) {}
    void NullLogger::error (const std::string &) {}

    void SystemLogger::debug (const std::string & msg) {
        LOG_DEBUG (msg);
    }

    void SystemLogger::info (const std::string & msg) {
        LOG_INFO (msg);
    }

    void SystemLogger::warn (const std::string & msg) {
        LOG_WARN (msg);
    }

    void SystemLogger::error (const std::string & msg) {
        LOG_ERROR (msg);
    }

    std::shared_ptr <Logger> orNull (std::shared_ptr <Logger> log) {
        if (log != nullptr) return log;
        return std::make_shared <NullLogger> ();
    }

}
