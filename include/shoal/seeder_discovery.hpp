#ifndef SHOAL_SEEDER_DISCOVERY_HEADER
#define SHOAL_SEEDER_DISCOVERY_HEADER

#include "settings.hpp"
#include "types.hpp"
#include "time.hpp"

#include <vector>
#include <set>

namespace shoal {

/**
 * Tracks the seeders of a single file and decides when to ask the channel for more.
 *
 * This class does no I/O: the owning transfer calls `poll` from its discovery timer
 * and carries out the returned action. Keeping it free of timers and sockets lets the
 * request pacing be reasoned about (and tested) in terms of plain time points.
 *
 * Seeder identities are stored lowercased; a banned seeder is never added back.
 */
class seeder_discovery
{
public:
    struct action
    {
        // Broadcast a `source_request` (already counted by discovery).
        bool request_sources = false;
        // Enough seeders are known, the download should begin.
        bool start_download = false;
        // Poll again after `seeder_request_interval`.
        bool keep_polling = false;
        // Discovery gave up without finding a single seeder.
        bool timed_out = false;
    };

private:
    const discovery_settings& settings_;

    // In the order they announced themselves, which is the round-robin order.
    std::vector<peer_id_t> seeders_;
    std::set<peer_id_t> banned_seeders_;

    time_point start_time_;
    time_point last_request_time_;
    int num_requests_ = 0;
    bool is_download_started_ = false;

public:
    explicit seeder_discovery(const discovery_settings& settings);

    /**
     * Records the initial source request, which the caller is expected to broadcast
     * right away.
     */
    void start(const time_point now);

    /**
     * Called at every `seeder_request_interval` tick. Re-requests sources while
     * fewer than the preferred number of seeders are known, the request budget
     * isn't spent and the interval has elapsed. Polling stops once the download
     * started with enough seeders, or the discovery timeout elapsed.
     */
    action poll(const time_point now);

    /** Returns true if `seeder` is new (and not banned). */
    bool add_seeder(const peer_id_t& seeder);

    /** Removes `seeder` for good. Returns true if it was a known seeder. */
    bool ban_seeder(const peer_id_t& seeder);

    /** Whether the start-early threshold is met but downloading hasn't begun. */
    bool should_start_download() const noexcept;
    void mark_download_started() noexcept { is_download_started_ = true; }
    bool is_download_started() const noexcept { return is_download_started_; }

    /**
     * During a download with fewer than the preferred number of seeders, sources are
     * refreshed every `seeder_refresh_interval`, as long as the request budget lasts.
     */
    bool should_refresh(const time_point now) const noexcept;

    /** Records a source request outside of `poll`. */
    void record_request(const time_point now) noexcept;

    const std::vector<peer_id_t>& seeders() const noexcept { return seeders_; }
    int num_seeders() const noexcept { return seeders_.size(); }
    int num_requests() const noexcept { return num_requests_; }
    bool is_banned(const peer_id_t& seeder) const;
};

} // namespace shoal

#endif // SHOAL_SEEDER_DISCOVERY_HEADER
