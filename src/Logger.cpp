#include <syslog.h>

// syslog.h claims several LOG_* names the logging macros use; keep its
// priorities, indexed by Logger::Level, and drop the macros.
static const int syslogPriority[] = {LOG_EMERG, LOG_ALERT, LOG_CRIT, LOG_ERR,
                                     LOG_WARNING, LOG_NOTICE, LOG_INFO, LOG_DEBUG};
#undef LOG_ALERT
#undef LOG_CRIT
#undef LOG_NOTICE
#undef LOG_INFO
#undef LOG_DEBUG

#include "Logger.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <sys/time.h>

Logger::Level Logger::level = Logger::INFO;
bool Logger::useSyslog = false;
std::mutex Logger::log_mutex;

const char *Logger::levelName(Level l)
{
    switch (l)
    {
    case EMERGENCY: return "EMERGENCY";
    case ALERT:     return "ALERT";
    case CRITICAL:  return "CRITICAL";
    case ERROR:     return "ERROR";
    case WARN:      return "WARN";
    case NOTICE:    return "NOTICE";
    case INFO:      return "INFO";
    case DEBUG:     return "DEBUG";
    }
    return "INFO";
}

bool Logger::setLevel(const std::string &name)
{
    static const Level all[] = {EMERGENCY, ALERT, CRITICAL, ERROR, WARN, NOTICE, INFO, DEBUG};
    for (Level l : all)
    {
        if (name == levelName(l))
        {
            setLevel(l);
            return true;
        }
    }
    return false;
}

void Logger::setLevel(Level l)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    level = l;
}

Logger::Level Logger::getLevel()
{
    std::lock_guard<std::mutex> lock(log_mutex);
    return level;
}

void Logger::enableSyslog(const char *ident)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!useSyslog)
    {
        openlog(ident, LOG_PID, LOG_DAEMON);
        useSyslog = true;
    }
}

void Logger::log(Level l, const char *module, const LogMsg &msg)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    if (l > level)
        return;

    struct timeval tv;
    gettimeofday(&tv, nullptr);
    struct tm tm_info;
    localtime_r(&tv.tv_sec, &tm_info);
    char ts[32];
    strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_info);

    const char *base = std::strrchr(msg.file, '/');
    base = base ? base + 1 : msg.file;

    std::fprintf(stderr, "%s.%03ld [%s:%s] %s (%s:%d)\n",
                 ts, (long) (tv.tv_usec / 1000), levelName(l), module,
                 msg.msg.c_str(), base, msg.line);

    if (useSyslog)
    {
        syslog(syslogPriority[l], "[%s:%s] %s", levelName(l), module, msg.msg.c_str());
    }
}
