#ifndef SHOAL_SETTINGS_HEADER
#define SHOAL_SETTINGS_HEADER

#include "path.hpp"
#include "time.hpp"

#include <cstdint>

namespace shoal {
namespace values {

constexpr int unlimited = -1;
constexpr int none = -2;

} // namespace values

/** Settings that govern how a single file is downloaded. */
struct transfer_settings
{
    // Every peer in a channel must use the same piece size, it is not negotiated.
    // The default is 128KiB.
    int piece_size = values::none;

    // The upper bound on outstanding piece requests per transfer.
    int max_concurrent_requests = 8;

    // If a requested piece doesn't arrive in this time, it is requested again,
    // possibly from another seeder.
    milliseconds piece_request_timeout{seconds{10}};

    // The number of times a single piece may time out or fail verification before
    // the whole transfer is failed. `values::unlimited` retries forever.
    int max_piece_attempts = 32;

    // After the first failure a piece is retried right away, after subsequent ones
    // the retry is delayed, starting at the base and doubling each time up to the
    // max.
    milliseconds piece_retry_backoff_base{250};
    milliseconds piece_retry_backoff_max{seconds{8}};

    // A seeder that timed out or sent corrupt data this many times is excluded from
    // the transfer. 0 or `values::unlimited` disables banning.
    int max_seeder_failures = 5;

    // When the scheduler found no seeder to send requests to, it tries again after
    // this interval.
    milliseconds idle_reschedule_interval{seconds{1}};

    // Files up to this size are assembled in memory, larger ones are spilled to a
    // file in `spill_path`, if one is set.
    int64_t in_memory_threshold = 10 * 1024 * 1024;
    path spill_path;
};

/** Settings of the per-file seeder discovery. */
struct discovery_settings
{
    // The download is started as soon as this many seeders announced themselves.
    int min_seeders = 1;

    // Discovery keeps requesting sources until this many seeders are known.
    int preferred_seeders = 3;

    // The total number of `source_request` broadcasts discovery may make for
    // a file.
    int max_seeder_requests = 10;

    milliseconds seeder_request_interval{seconds{2}};
    milliseconds seeder_discovery_timeout{seconds{30}};

    // While downloading with fewer than the preferred number of seeders, sources
    // are requested again at this interval.
    milliseconds seeder_refresh_interval{seconds{10}};

    enum class no_seeder_policy
    {
        // The transfer stays pending and is resumed when a seeder shows up.
        keep_pending,
        // The transfer is failed when discovery times out without any seeder.
        fail
    };

    no_seeder_policy no_seeders = no_seeder_policy::keep_pending;
};

/** Settings of the persistent seed store. */
struct seed_store_settings
{
    // Completed files are persisted here. If empty, nothing is persisted.
    path seed_store_path;

    // The upper bound on the total size of all persisted files. The default is
    // 500MiB.
    int64_t max_seed_storage = values::none;

    // Records older than this are purged on startup.
    int seed_files_expire_days = 7;

    bool persist_public_channels = true;
    // Files of password protected channels are not persisted by default.
    bool persist_private_channels = false;
};

struct settings
{
    // Uploads larger than this are rejected. The default is 500MiB.
    int64_t max_file_size = values::none;

    // The number of threads that hash uploads and write seed records.
    int concurrency = values::none;

    // Whether to re-announce held files when the user (re)joins a channel.
    bool auto_seed_on_join = true;

    // Past this number the oldest alerts are dropped.
    int alert_queue_capacity = 1000;

    transfer_settings transfer;
    discovery_settings discovery;
    seed_store_settings seed_store;
};

} // namespace shoal

#endif // SHOAL_SETTINGS_HEADER
