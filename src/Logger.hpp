#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <sstream>
#include <string>
#include <mutex>

// Every translation unit that logs defines MODULE before using the macros.
#define LOG_EMER(msg)   { std::stringstream ss; ss << msg; Logger::log(Logger::EMERGENCY, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_ALERT(msg)  { std::stringstream ss; ss << msg; Logger::log(Logger::ALERT, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_CRIT(msg)   { std::stringstream ss; ss << msg; Logger::log(Logger::CRITICAL, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_ERROR(msg)  { std::stringstream ss; ss << msg; Logger::log(Logger::ERROR, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_WARN(msg)   { std::stringstream ss; ss << msg; Logger::log(Logger::WARN, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_NOTICE(msg) { std::stringstream ss; ss << msg; Logger::log(Logger::NOTICE, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#define LOG_INFO(msg)   { std::stringstream ss; ss << msg; Logger::log(Logger::INFO, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }

#if defined(ENABLE_LOG_DEBUG)
#define LOG_DEBUG(msg)  { std::stringstream ss; ss << msg; Logger::log(Logger::DEBUG, MODULE, LogMsg(ss.str(), __FILE__, __LINE__)); }
#else
#define LOG_DEBUG(msg)
#endif

// Developer debug, compiled out unless DDEBUG is set
#if defined(DDEBUG)
#define LOG_DDEBUG(msg) LOG_DEBUG(msg)
#else
#define LOG_DDEBUG(msg)
#endif

struct LogMsg
{
    LogMsg(std::string m, const char *f, int l) : msg(std::move(m)), file(f), line(l) {}

    std::string msg;
    const char *file;
    int line;
};

class Logger
{
public:
    enum Level
    {
        EMERGENCY,
        ALERT,
        CRITICAL,
        ERROR,
        WARN,
        NOTICE,
        INFO,
        DEBUG
    };

    // Accepts the level names used in the configuration file.
    // Returns false and keeps the current level if the name is unknown.
    static bool setLevel(const std::string &name);
    static void setLevel(Level level);
    static Level getLevel();

    static void enableSyslog(const char *ident);

    static void log(Level level, const char *module, const LogMsg &msg);

private:
    static const char *levelName(Level level);

    static Level level;
    static bool useSyslog;
    static std::mutex log_mutex;
};

#endif // LOGGER_HPP
