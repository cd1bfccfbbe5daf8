#ifndef SHOAL_TRANSFER_HEADER
#define SHOAL_TRANSFER_HEADER

#include "exponential_backoff.hpp"
#include "seeder_discovery.hpp"
#include "file_metadata.hpp"
#include "piece_storage.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"
#include "settings.hpp"
#include "types.hpp"
#include "time.hpp"
#include "log.hpp"

#include <functional>
#include <cstdint>
#include <memory>
#include <vector>
#include <map>

#include <asio/io_context.hpp>

namespace shoal {

class alert_queue;
class transport;

/** A snapshot of a transfer's state, for users and diagnostics. */
struct transfer_info
{
    enum state_t
    {
        discovering,
        downloading,
        completed,
        failed,
        cancelled
    };

    file_id_t file_id;
    state_t state = discovering;
    int num_pieces = 0;
    int num_received_pieces = 0;
    int num_pending_pieces = 0;
    int num_in_flight = 0;
    int num_seeders = 0;
    int num_source_requests = 0;
    int num_failed_attempts = 0;
};

/**
 * Downloads a single file from the seeders of a channel.
 *
 * Seeders are found via `seeder_discovery`. Once the minimum number of seeders is
 * known, pending pieces are requested in index order, at most
 * `max_concurrent_requests` at a time, each from the next seeder in round-robin
 * order. Every received piece is verified against its SHA-256 hash before being
 * stored. Requests that time out and pieces that fail verification are retried
 * (with backoff after the first failure) until the attempt limit, and the seeder
 * responsible is charged a failure; too many and it is banned from this transfer.
 *
 * All of this runs on the network thread. Timer and broadcast completions may race
 * with received pieces, so every handler re-checks that the state it was started for
 * still holds before acting.
 *
 * A transfer is used via `std::shared_ptr` as its asynchronous handlers keep it
 * alive. Once it completed, failed or was aborted, it's inert.
 */
class transfer : public std::enable_shared_from_this<transfer>
{
public:
    /**
     * Invoked exactly once, when the transfer reached a terminal state other than
     * being aborted. On success `file` holds the assembled file.
     */
    using finished_handler = std::function<void(
            const file_id_t&, uint64_t generation, const error_code&,
            std::shared_ptr<const byte_source> file)>;

private:
    enum class piece_status : uint8_t
    {
        pending,
        requested,
        done
    };

    struct piece_state
    {
        piece_status status = piece_status::pending;
        int num_failures = 0;
        // A failed piece may not be requested again before this time.
        time_point retry_after;
        exponential_backoff<milliseconds> backoff;

        explicit piece_state(exponential_backoff<milliseconds> b) : backoff(b) {}
    };

    struct piece_request
    {
        peer_id_t seeder;
        // Distinguishes this request from a later one for the same piece, in case the
        // timeout handler of the earlier one could not be cancelled in time.
        uint64_t serial;
        std::unique_ptr<deadline_timer> timeout_timer;
    };

    asio::io_context& ios_;
    transport& transport_;
    alert_queue& alert_queue_;
    const settings& settings_;

    const file_metadata metadata_;
    const channel_ref channel_;
    const channel_key key_;
    const peer_id_t local_peer_id_;
    const uint64_t generation_;

    std::unique_ptr<piece_storage> storage_;

    std::vector<piece_state> pieces_;
    std::map<piece_index_t, piece_request> in_flight_;
    int num_received_pieces_ = 0;
    int num_failed_attempts_ = 0;
    uint64_t next_request_serial_ = 0;

    seeder_discovery discovery_;
    // Keeps advancing across scheduling rounds, so consecutive requests go to
    // consecutive seeders.
    size_t round_robin_cursor_ = 0;
    std::map<peer_id_t, int> seeder_failures_;

    deadline_timer discovery_timer_;
    deadline_timer reschedule_timer_;
    // The time at which reschedule_timer_ fires, if armed.
    time_point reschedule_time_ = time_point::max();

    transfer_info::state_t state_ = transfer_info::discovering;

    finished_handler finished_handler_;

    enum class log_event
    {
        discovery,
        request,
        receive,
        verify,
        complete
    };

public:
    /**
     * `storage` must have been created for `metadata`. `metadata` must be valid, see
     * `verify_metadata`.
     */
    transfer(asio::io_context& ios, transport& transport, alert_queue& alerts,
            const settings& settings, file_metadata metadata,
            std::unique_ptr<piece_storage> storage, channel_ref channel, channel_key key,
            peer_id_t local_peer_id, uint64_t generation, finished_handler handler);

    transfer(const transfer&) = delete;
    transfer& operator=(const transfer&) = delete;

    /** Starts seeder discovery. */
    void start();

    /**
     * Stops all activity: timers are cancelled, in-flight requests are forgotten and
     * the finished handler is not invoked. Messages for this transfer arriving later
     * are ignored.
     */
    void abort();

    void on_source_announce(const peer_id_t& seeder);
    void on_piece(const piece_index_t index, const peer_id_t& sender,
            const_view<uint8_t> data);

    const file_id_t& file_id() const noexcept { return metadata_.file_id; }
    const file_metadata& metadata() const noexcept { return metadata_; }
    const channel_ref& channel() const noexcept { return channel_; }
    uint64_t generation() const noexcept { return generation_; }
    bool is_active() const noexcept;
    transfer_info info() const;

private:
    void on_discovery_timer(const error_code& error);
    void start_download();

    /**
     * Requests pending pieces in index order while fewer than
     * `max_concurrent_requests` are in flight, and refreshes the seeder set if it's
     * due.
     */
    void manage_download();
    void request_piece(const piece_index_t index, const peer_id_t& seeder);
    const peer_id_t& next_seeder() noexcept;
    void request_sources(const char* reason);

    void on_request_timeout(const piece_index_t index, const uint64_t serial);

    /**
     * Returns the piece to pending and either schedules a retry or fails the transfer
     * if the piece ran out of attempts. `seeder` is charged with the failure.
     */
    void handle_failed_piece(const piece_index_t index, const peer_id_t& seeder);
    void record_seeder_failure(const peer_id_t& seeder);
    void schedule_manage_download(const time_point when);

    void on_all_pieces_received();
    void finish(const error_code& error, std::shared_ptr<const byte_source> file);
    void stop_timers();

    void post_progress();
    void post_seeder_update();

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

inline bool transfer::is_active() const noexcept
{
    return state_ == transfer_info::discovering || state_ == transfer_info::downloading;
}

} // namespace shoal

#endif // SHOAL_TRANSFER_HEADER
