#include "log.hpp"

#include <cassert>
#include <fstream>
#include <mutex>
#include <map>
#ifdef SHOAL_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // SHOAL_ENABLE_STREAM_DEBUGGING

namespace shoal {
namespace log {
namespace detail {

#define SHOAL_FLUSH(f)                                                                   \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

class engine_logger
{
    std::ofstream file_;

public:
    void log(const std::string& header, const std::string& log, const priority priority);
    void flush() { SHOAL_FLUSH(file_); }
};

/** Storage is touched from the thread pool as well, so this logger is thread-safe. */
class storage_logger
{
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    void log(const std::string& header, const std::string& log, const bool concurrent,
            const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        SHOAL_FLUSH(file_);
    }
};

class transfer_logger
{
    std::map<file_id_t, std::ofstream> files_;

public:
    void log(const file_id_t& file_id, const std::string& header,
            const std::string& log, const priority priority);
    void flush()
    {
        for(auto& e : files_) {
            SHOAL_FLUSH(e.second);
        }
    }
};

// global logger instances

engine_logger engine_logger;
storage_logger storage_logger;
transfer_logger transfer_logger;

#ifndef SHOAL_MIN_LOG_PRIORITY
#define SHOAL_MIN_LOG_PRIORITY priority::low
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

inline std::string make_log_path(const std::string& name)
{
#ifdef SHOAL_LOG_PATH
    return std::string(SHOAL_LOG_PATH) + '/' + name + "-log.txt";
#else
    return name + "-log.txt";
#endif
}

#ifdef SHOAL_ENABLE_LOGGING

#define SHOAL_PRIORITY_CHAR(p)                                                           \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define SHOAL_LOG(priority, stream, header, log)                                         \
    stream << '[' << SHOAL_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

#ifdef SHOAL_ENABLE_STREAM_DEBUGGING
#define SHOAL_STREAM std::clog
#define SHOAL_CLOG(priority, file, header, log)                                          \
    do {                                                                                 \
        assert(file.is_open());                                                          \
        SHOAL_LOG(priority, file, header, log);                                          \
        SHOAL_LOG(priority, SHOAL_STREAM, header, log);                                  \
    } while(0)
#else // SHOAL_ENABLE_STREAM_DEBUGGING
#define SHOAL_CLOG(p, f, h, l) SHOAL_LOG(p, f, h, l)
#endif // SHOAL_ENABLE_STREAM_DEBUGGING

#endif // SHOAL_ENABLE_LOGGING

void engine_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef SHOAL_ENABLE_LOGGING
    if(priority < SHOAL_MIN_LOG_PRIORITY) {
        return;
    }
    if(!file_.is_open()) {
        file_.open(make_log_path("engine"), g_open_mode);
    }
    SHOAL_CLOG(priority, file_, header, log);
#endif // SHOAL_ENABLE_LOGGING
}

void storage_logger::log(const std::string& header, const std::string& log,
        const bool concurrent, const priority priority)
{
#ifdef SHOAL_ENABLE_LOGGING
    if(priority < SHOAL_MIN_LOG_PRIORITY) {
        return;
    }
    // clog is only written from the network thread, otherwise every log call from
    // the thread pool would have to lock it
#ifdef SHOAL_ENABLE_STREAM_DEBUGGING
    if(!concurrent) {
        SHOAL_LOG(priority, SHOAL_STREAM, header, log);
    }
#endif // SHOAL_ENABLE_STREAM_DEBUGGING
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path("storage"), g_open_mode);
    }
    SHOAL_LOG(priority, file_, header, log);
#endif // SHOAL_ENABLE_LOGGING
}

void transfer_logger::log(const file_id_t& file_id, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef SHOAL_ENABLE_LOGGING
    if(priority < SHOAL_MIN_LOG_PRIORITY) {
        return;
    }
    auto it = files_.find(file_id);
    if(it == files_.end()) {
        const auto path = make_log_path("transfer#" + file_id);
        it = files_.emplace(file_id, std::ofstream(path.c_str(), g_open_mode)).first;
    }
    SHOAL_CLOG(priority, it->second, header, log);
#ifdef SHOAL_MERGE_TRANSFER_LOGS
    engine_logger.log("(transfer#" + file_id + ')' + header, log, priority);
#endif // SHOAL_MERGE_TRANSFER_LOGS
#endif // SHOAL_ENABLE_LOGGING
}

} // namespace detail

void log_transfer(const file_id_t& file_id, const std::string& header,
        const std::string& log, const priority priority)
{
    detail::transfer_logger.log(file_id, header, log, priority);
}

void log_engine(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::engine_logger.log(header, log, priority);
}

void log_storage(const std::string& header, const std::string& log,
        const bool concurrent, const priority priority)
{
    detail::storage_logger.log(header, log, concurrent, priority);
}

void flush()
{
    detail::transfer_logger.flush();
    detail::engine_logger.flush();
    detail::storage_logger.flush();
}

} // namespace log
} // namespace shoal
