#ifndef SHOAL_ENGINE_HEADER
#define SHOAL_ENGINE_HEADER

#include "seeding_responder.hpp"
#include "piece_storage.hpp"
#include "file_metadata.hpp"
#include "piece_hasher.hpp"
#include "thread_pool.hpp"
#include "alert_queue.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"
#include "seed_store.hpp"
#include "settings.hpp"
#include "transfer.hpp"
#include "protocol.hpp"
#include "types.hpp"
#include "view.hpp"
#include "log.hpp"

#include <unordered_map>
#include <functional>
#include <cstdint>
#include <memory>
#include <deque>

#include <asio/io_context.hpp>

namespace shoal {

class channel_directory;
class transport;

/**
 * This class represents a file sharing node. It is the glue for, and the public
 * interface to, all components: uploads are hashed and seeded, downloads are
 * discovered, scheduled and verified, and completed files are persisted so that they
 * can be seeded again after a restart.
 *
 * The engine runs entirely on the caller's `io_context`, and all of its functions
 * must be called on the thread running it. Inbound messages are fed in through
 * `handle_message`, outbound ones leave through the `transport`. Only hashing and
 * writing to the seed store happen on a separate thread pool.
 *
 * Results of asynchronous operations and other events are reported through the
 * alert queue.
 */
class engine
{
public:
    using upload_handler = std::function<void(const error_code&, const file_metadata&)>;

private:
    asio::io_context& network_ios_;
    transport& transport_;
    const channel_directory& channels_;

    // This contains all the user configurable options, a const reference to which is
    // passed down to most components of the engine.
    const settings settings_;

    // Internal entities communicate with user asynchronously via this queue. It's
    // thread-safe.
    alert_queue alert_queue_;

    // Pieces of in-memory downloads are allocated from here.
    piece_buffer_pool piece_buffer_pool_;

    thread_pool thread_pool_;
    piece_hasher piece_hasher_;

    // The files we hold and serve.
    seeding_responder seeding_responder_;
    seed_store seed_store_;

    // At most one live transfer exists per file. Each is given a new generation, so
    // that completions of a transfer that has since been replaced are recognized.
    std::unordered_map<file_id_t, std::shared_ptr<transfer>> transfers_;
    uint64_t next_generation_ = 0;

    // The results of downloads completed during this session.
    std::unordered_map<file_id_t, std::shared_ptr<const byte_source>> downloads_;

    // Handlers that may outlive the engine hold a weak reference to this.
    std::shared_ptr<int> lifetime_token_ = std::make_shared<int>(0);

    enum class log_event
    {
        upload,
        download,
        message,
        seed,
        storage
    };

public:
    /**
     * Throws `std::invalid_argument` if a setting is out of range. If a seed store
     * path is configured, the records persisted there are loaded and seeded.
     */
    engine(asio::io_context& network_ios, transport& transport,
            const channel_directory& channels, settings s = settings());
    ~engine();

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    /**
     * Hashes `source` in the background and, once done, starts seeding it on
     * `channel`. `handler`, if set, receives the new file's metadata, which the
     * caller is responsible for announcing to the channel. A `file_hashed_alert` or
     * `hashing_failed_alert` is posted as well. The file is then persisted, if the
     * channel's privacy class allows it.
     */
    void upload_file(const channel_ref& channel, std::shared_ptr<const byte_source> source,
            std::string file_name, std::string mime_type,
            upload_handler handler = upload_handler());

    /**
     * Starts downloading the file described by `metadata`, whose seeders are looked
     * for on `channel`. Requests are encrypted with `key`, if not empty. Does
     * nothing if the file is already being downloaded or seeded.
     *
     * Throws `std::invalid_argument` if `metadata` is malformed.
     */
    void start_download(const channel_ref& channel, const file_metadata& metadata,
            const channel_key& key = channel_key());

    /**
     * Stops the download and discards the pieces received so far. Returns whether
     * a live download was found.
     */
    bool cancel_download(const file_id_t& file_id);

    bool is_seeding(const file_id_t& file_id) const;
    bool is_downloading(const file_id_t& file_id) const;

    /**
     * Returns the contents of a completed download or of a file we seed, or nullptr
     * if neither exists. The returned handle stays valid for as long as it is held.
     */
    std::shared_ptr<const byte_source> get_file(const file_id_t& file_id) const;

    /**
     * Announces every held file of `channel`, such as after (re)joining it. Returns
     * the number of files announced, which is 0 if `auto_seed_on_join` is disabled.
     */
    int reannounce_for_channel(const channel_ref& channel);

    /**
     * Processes a message received on `channel`. Malformed messages and those not
     * meant for us are dropped.
     */
    void handle_message(const channel_ref& channel, const_view<uint8_t> payload);

    /** Returns false if no transfer for `file_id` is live. */
    bool transfer_status(const file_id_t& file_id, transfer_info& info) const;

    seed_store::stats storage_stats() const;
    std::vector<seed_record> seed_records_for_channel(const channel_ref& channel) const;

    /** Deletes the persisted record and stops seeding the file. */
    void remove_seed_file(const file_id_t& file_id, error_code& error);
    void clear_seed_files(error_code& error);

    /**
     * Returns a queue of all the alerts that occurred since the last call to this
     * function. Alerts are chronologically ordered.
     */
    std::deque<std::unique_ptr<alert>> alerts();

    /** `fn` is called on the network thread whenever an alert is posted. */
    void set_alert_notify(std::function<void()> fn);

    const settings& get_settings() const noexcept { return settings_; }
    int num_seeded_files() const noexcept { return seeding_responder_.num_files(); }

private:
    static settings checked_settings(settings s);
    static void verify(const settings& s);
    static void verify(const transfer_settings& s);
    static void verify(const discovery_settings& s);
    static void verify(const seed_store_settings& s);
    static void fill_in_defaults(settings& s);

    void load_seed_store();

    void on_file_hashed(const channel_ref& channel,
            std::shared_ptr<const byte_source> source, const std::string& file_name,
            const error_code& error, file_metadata metadata, const upload_handler& handler);

    void on_transfer_finished(const file_id_t& file_id, const uint64_t generation,
            const error_code& error, std::shared_ptr<const byte_source> file);

    /** Stores the file in the seed store if its channel's privacy class allows it. */
    void persist(const channel_ref& channel, const file_metadata& metadata,
            std::shared_ptr<const byte_source> source);
    void on_seed_evicted(const seed_record& record);

    void handle_source_request(const channel_ref& channel, const protocol::message& msg);
    void handle_source_announce(const protocol::message& msg);
    void handle_piece_request(const channel_ref& channel, const protocol::message& msg);
    void handle_file_piece(const protocol::message& msg);

    std::shared_ptr<transfer> find_transfer(const file_id_t& file_id) const;

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

} // namespace shoal

#endif // SHOAL_ENGINE_HEADER
