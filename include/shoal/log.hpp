#ifndef SHOAL_LOG_HEADER
#define SHOAL_LOG_HEADER

#include "types.hpp"

#include <string>

namespace shoal {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

void log_transfer(const file_id_t& file_id, const std::string& header,
        const std::string& log, const priority priority = priority::normal);
void log_engine(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Hashing and seed store writes run on the thread pool, in which case `concurrent`
 * must be set so that nothing but the (mutually excluded) log file is touched.
 */
void log_storage(const std::string& header, const std::string& log,
        const bool concurrent = false, const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // namespace log
} // namespace shoal

#endif // SHOAL_LOG_HEADER
