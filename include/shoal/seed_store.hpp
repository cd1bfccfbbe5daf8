#ifndef SHOAL_SEED_STORE_HEADER
#define SHOAL_SEED_STORE_HEADER

#include "file_metadata.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"
#include "settings.hpp"
#include "types.hpp"
#include "path.hpp"
#include "log.hpp"
#include "time.hpp"

#include <functional>
#include <cstdint>
#include <memory>
#include <vector>
#include <map>
#include <set>

#include <asio/io_context.hpp>

namespace shoal {

class thread_pool;

/** The durable description of a persisted file. Its contents are stored separately. */
struct seed_record
{
    file_metadata metadata;
    channel_ref channel;
    channel_privacy privacy = channel_privacy::open;
    // Milliseconds since the UNIX epoch at which the record was written.
    int64_t timestamp = 0;
};

/**
 * Retains completed files on disk, within a fixed quota, so that they can be seeded
 * again after a restart.
 *
 * Each record is a pair of files in `seed_store_path`: `<file_id>.data` with the
 * file's contents and `<file_id>.seed` with the encoded `seed_record`. Both are
 * written under a temporary name and renamed into place, contents first, so a record
 * exists if and only if its header does.
 *
 * The index (by id, by timestamp for eviction and by channel for channel scoped
 * queries) lives in memory and is only touched on the network thread. Writing the
 * contents, which may take a while, is done on the thread pool, and the record only
 * enters the index once written. Its size is reserved against the quota meanwhile,
 * so concurrent writes can never overshoot it.
 */
class seed_store
{
public:
    using persist_handler = std::function<void(const error_code&)>;
    using eviction_handler = std::function<void(const seed_record&)>;

    struct stats
    {
        int64_t used_bytes = 0;
        int64_t max_bytes = 0;
        int num_records = 0;
    };

    struct loaded_record
    {
        seed_record record;
        std::shared_ptr<const byte_source> source;
    };

private:
    asio::io_context& network_ios_;
    thread_pool& thread_pool_;
    const seed_store_settings& settings_;

    std::map<file_id_t, seed_record> records_;
    std::multimap<int64_t, file_id_t> by_timestamp_;
    std::multimap<channel_ref, file_id_t> by_channel_;

    // Records being written.
    std::set<file_id_t> pending_writes_;
    // Pending writes whose record was removed in the meantime. Their files are
    // deleted instead of indexed once written.
    std::set<file_id_t> cancelled_writes_;

    // The sum of the sizes of all records in `records_`, and of those being written.
    int64_t used_bytes_ = 0;
    int64_t reserved_bytes_ = 0;

    eviction_handler eviction_handler_;

    // Persist completions hold a weak reference to this, so that they become no-ops
    // if the store is destroyed before they run.
    std::shared_ptr<int> lifetime_token_ = std::make_shared<int>(0);

public:
    seed_store(asio::io_context& network_ios, thread_pool& thread_pool,
            const seed_store_settings& settings);

    /** Persistence is disabled if no `seed_store_path` is configured. */
    bool is_enabled() const noexcept { return !settings_.seed_store_path.empty(); }

    /** Whether files of a channel of the given privacy class may be persisted. */
    bool is_eligible(const channel_privacy privacy) const noexcept;

    /**
     * Called once on startup. Purges records older than `seed_files_expire_days`
     * (relative to `now`), corrupt records and leftovers of interrupted writes, then
     * indexes and maps the remaining records. The number of purged expired records is
     * stored in `num_expired`.
     */
    std::vector<loaded_record> load(
            const system_time_point now, int& num_expired, error_code& error);

    /**
     * Persists `source` as `record`. If the quota would be exceeded, the oldest
     * records are evicted until at least the file's size is freed. If that's still
     * not enough (or the file is larger than the quota to begin with), the write
     * fails with `seed_store_errc::quota_exceeded`; records evicted by then stay
     * evicted.
     *
     * `handler` is always invoked on the network thread, also when the file was
     * found ineligible, or already persisted, in which case no error is reported. It
     * is not invoked if the store is destroyed first.
     */
    void async_persist(seed_record record, std::shared_ptr<const byte_source> source,
            persist_handler handler);

    /**
     * Deletes the record and its contents. If the record is still being written, the
     * write is cancelled: its files are deleted once written and its handler receives
     * `seed_store_errc::write_cancelled`.
     */
    void remove(const file_id_t& file_id, error_code& error);

    /** Deletes all records and cancels all writes in progress. */
    void clear(error_code& error);

    /**
     * Evicts records, oldest first, until at least `num_bytes` are freed or no records
     * remain. Returns the number of bytes freed.
     */
    int64_t evict_oldest(const int64_t num_bytes);

    /** Invoked for every evicted record, after it was removed from the store. */
    void set_eviction_handler(eviction_handler handler);

    bool contains(const file_id_t& file_id) const;
    bool is_writing(const file_id_t& file_id) const;
    bool is_cancelled(const file_id_t& file_id) const;
    const seed_record* find(const file_id_t& file_id) const;
    std::vector<seed_record> records_for_channel(const channel_ref& channel) const;
    /** The ids of all records, those still being written included. */
    std::vector<file_id_t> file_ids() const;
    stats get_stats() const;

    path header_path(const file_id_t& file_id) const;
    path data_path(const file_id_t& file_id) const;

private:
    void add_to_index(seed_record record);
    void erase_from_index(const file_id_t& file_id);
    void delete_files(const file_id_t& file_id, error_code& error);
    int64_t max_bytes() const noexcept { return settings_.max_seed_storage; }

    template <typename... Args>
    void log(const char* format, Args&&... args) const;

    template <typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

/** Serialization of the record header files. */
std::vector<uint8_t> encode_seed_record(const seed_record& record);
seed_record decode_seed_record(const_view<uint8_t> buffer, error_code& error);

} // namespace shoal

#endif // SHOAL_SEED_STORE_HEADER
