#include "engine.hpp"
#include "seed_store_error.hpp"
#include "transfer_error.hpp"
#include "string_utils.hpp"
#include "transport.hpp"

#include <algorithm>
#include <stdexcept>

#include <asio/post.hpp>

namespace shoal {

engine::engine(asio::io_context& network_ios, transport& transport,
        const channel_directory& channels, settings s)
    : network_ios_(network_ios)
    , transport_(transport)
    , channels_(channels)
    , settings_(checked_settings(std::move(s)))
    , alert_queue_(settings_.alert_queue_capacity)
    , piece_buffer_pool_(settings_.transfer.piece_size)
    , thread_pool_(settings_.concurrency)
    , piece_hasher_(network_ios_, thread_pool_)
    , seeding_responder_(transport_, channels_)
    , seed_store_(network_ios_, thread_pool_, settings_.seed_store)
{
    seed_store_.set_eviction_handler(
            [this](const seed_record& record) { on_seed_evicted(record); });
    load_seed_store();
}

engine::~engine()
{
    for(auto& e : transfers_) {
        e.second->abort();
    }
    transfers_.clear();
    // Outstanding hashing and store jobs are finished, but their completion
    // handlers are no-ops from now on.
    thread_pool_.join();
}

void engine::load_seed_store()
{
    if(!seed_store_.is_enabled()) {
        return;
    }
    error_code error;
    int num_expired = 0;
    auto records = seed_store_.load(system_clock::now(), num_expired, error);
    if(error) {
        log(log_event::storage, log::priority::high, "couldn't load seed store: %s",
                error.message().c_str());
        alert_queue_.emplace<error_alert>(error);
        return;
    }
    for(auto& r : records) {
        local_file file;
        file.metadata = r.record.metadata;
        file.source = std::move(r.source);
        file.channel = r.record.channel;
        file.is_persisted = true;
        seeding_responder_.add(std::move(file));
    }
    log(log_event::storage, "seeding %d persisted files, %d expired",
            int(records.size()), num_expired);
    alert_queue_.emplace<seeds_loaded_alert>(int(records.size()), num_expired);
}

// -- upload --

void engine::upload_file(const channel_ref& channel,
        std::shared_ptr<const byte_source> source, std::string file_name,
        std::string mime_type, upload_handler handler)
{
    if(source == nullptr) {
        throw std::invalid_argument("upload_file requires a byte source");
    }
    log(log_event::upload, "hashing '%s' (%lld bytes) for %s", file_name.c_str(),
            static_cast<long long>(source->size()), channel.c_str());
    auto callback = [this, token = std::weak_ptr<int>(lifetime_token_), channel,
                            source, file_name, handler = std::move(handler)](
                            const error_code& error, file_metadata metadata) {
        if(token.expired()) {
            return;
        }
        on_file_hashed(channel, std::move(source), file_name, error,
                std::move(metadata), handler);
    };
    piece_hasher_.async_hash(source, std::move(file_name), std::move(mime_type),
            settings_.transfer.piece_size, settings_.max_file_size, std::move(callback));
}

void engine::on_file_hashed(const channel_ref& channel,
        std::shared_ptr<const byte_source> source, const std::string& file_name,
        const error_code& error, file_metadata metadata, const upload_handler& handler)
{
    if(error) {
        log(log_event::upload, log::priority::high, "couldn't hash '%s': %s",
                file_name.c_str(), error.message().c_str());
        alert_queue_.emplace<hashing_failed_alert>(file_name, error);
        if(handler) {
            handler(error, metadata);
        }
        return;
    }

    log(log_event::upload, "'%s' is now %s (%d pieces)", file_name.c_str(),
            metadata.file_id.c_str(), metadata.num_pieces);
    local_file file;
    file.metadata = metadata;
    file.source = source;
    file.channel = channel;
    seeding_responder_.add(std::move(file));
    persist(channel, metadata, std::move(source));

    if(handler) {
        handler(error, metadata);
    }
    alert_queue_.emplace<file_hashed_alert>(channel, metadata);
}

// -- download --

void engine::start_download(const channel_ref& channel, const file_metadata& metadata,
        const channel_key& key)
{
    error_code error;
    verify_metadata(metadata, settings_.transfer.piece_size, settings_.max_file_size,
            error);
    if(error) {
        throw std::invalid_argument("invalid file metadata for download");
    }

    const auto& file_id = metadata.file_id;
    if(is_downloading(file_id) || is_seeding(file_id)) {
        log(log_event::download, log::priority::low, "%s already held or downloading",
                file_id.c_str());
        return;
    }

    auto storage = create_piece_storage(
            metadata, settings_.transfer, piece_buffer_pool_, error);
    if(error) {
        log(log_event::download, log::priority::high,
                "couldn't allocate storage for %s: %s", file_id.c_str(),
                error.message().c_str());
        alert_queue_.emplace<transfer_failed_alert>(file_id, error);
        return;
    }

    const uint64_t generation = ++next_generation_;
    // Finishing is deferred so that the transfer is not destroyed by its own
    // callback.
    auto on_finished = [this, token = std::weak_ptr<int>(lifetime_token_)](
                               const file_id_t& file_id, uint64_t generation,
                               const error_code& error,
                               std::shared_ptr<const byte_source> file) {
        asio::post(network_ios_, [this, token, file_id, generation, error,
                                         file = std::move(file)]() mutable {
            if(!token.expired()) {
                on_transfer_finished(file_id, generation, error, std::move(file));
            }
        });
    };
    auto t = std::make_shared<transfer>(network_ios_, transport_, alert_queue_,
            settings_, metadata, std::move(storage), channel, key,
            channels_.local_peer_id(), generation, std::move(on_finished));
    transfers_.emplace(file_id, t);
    log(log_event::download, "starting %s ('%s', generation %llu) on %s",
            file_id.c_str(), metadata.file_name.c_str(),
            static_cast<unsigned long long>(generation), channel.c_str());
    t->start();
}

bool engine::cancel_download(const file_id_t& file_id)
{
    auto it = transfers_.find(file_id);
    if(it == transfers_.end()) {
        return false;
    }
    auto t = it->second;
    transfers_.erase(it);
    t->abort();
    log(log_event::download, "cancelled %s", file_id.c_str());
    alert_queue_.emplace<transfer_cancelled_alert>(file_id);
    return true;
}

void engine::on_transfer_finished(const file_id_t& file_id, const uint64_t generation,
        const error_code& error, std::shared_ptr<const byte_source> file)
{
    auto it = transfers_.find(file_id);
    if(it == transfers_.end() || it->second->generation() != generation) {
        log(log_event::download, log::priority::low,
                "ignoring completion of stale transfer %s (generation %llu)",
                file_id.c_str(), static_cast<unsigned long long>(generation));
        return;
    }
    const file_metadata metadata = it->second->metadata();
    const channel_ref channel = it->second->channel();
    transfers_.erase(it);

    if(error) {
        log(log_event::download, log::priority::high, "%s failed: %s",
                file_id.c_str(), error.message().c_str());
        alert_queue_.emplace<transfer_failed_alert>(file_id, error);
        return;
    }

    log(log_event::download, "%s complete, seeding it on %s", file_id.c_str(),
            channel.c_str());
    downloads_[file_id] = file;
    local_file local;
    local.metadata = metadata;
    local.source = file;
    local.channel = channel;
    seeding_responder_.add(std::move(local));
    alert_queue_.emplace<download_complete_alert>(metadata, file);
    seeding_responder_.announce(channel, file_id, channels_.key_for(channel));
    persist(channel, metadata, std::move(file));
}

bool engine::is_seeding(const file_id_t& file_id) const
{
    return seeding_responder_.contains(file_id);
}

bool engine::is_downloading(const file_id_t& file_id) const
{
    return transfers_.find(file_id) != transfers_.end();
}

std::shared_ptr<const byte_source> engine::get_file(const file_id_t& file_id) const
{
    auto it = downloads_.find(file_id);
    if(it != downloads_.end()) {
        return it->second;
    }
    if(const auto* file = seeding_responder_.find(file_id)) {
        return file->source;
    }
    return nullptr;
}

bool engine::transfer_status(const file_id_t& file_id, transfer_info& info) const
{
    auto t = find_transfer(file_id);
    if(t == nullptr) {
        return false;
    }
    info = t->info();
    return true;
}

std::shared_ptr<transfer> engine::find_transfer(const file_id_t& file_id) const
{
    auto it = transfers_.find(file_id);
    return it != transfers_.end() ? it->second : nullptr;
}

// -- seeding --

int engine::reannounce_for_channel(const channel_ref& channel)
{
    if(!settings_.auto_seed_on_join) {
        return 0;
    }
    const int n = seeding_responder_.announce_channel_files(
            channel, channels_.key_for(channel));
    log(log_event::seed, "re-announced %d files on %s", n, channel.c_str());
    return n;
}

void engine::handle_message(const channel_ref& channel, const_view<uint8_t> payload)
{
    error_code error;
    const auto msg = protocol::decode(payload, error);
    if(error) {
        log(log_event::message, log::priority::low,
                "dropping malformed message (%d bytes) on %s: %s", int(payload.size()),
                channel.c_str(), error.message().c_str());
        return;
    }
    switch(msg.type) {
    case protocol::message_type::source_request:
        handle_source_request(channel, msg);
        break;
    case protocol::message_type::source_announce:
        handle_source_announce(msg);
        break;
    case protocol::message_type::piece_request:
        handle_piece_request(channel, msg);
        break;
    case protocol::message_type::file_piece:
        handle_file_piece(msg);
        break;
    }
}

void engine::handle_source_request(
        const channel_ref& channel, const protocol::message& msg)
{
    seeding_responder_.on_source_request(channel, msg.file_id);
}

void engine::handle_source_announce(const protocol::message& msg)
{
    if(auto t = find_transfer(msg.file_id)) {
        t->on_source_announce(msg.peer_id);
    }
}

void engine::handle_piece_request(const channel_ref& channel, const protocol::message& msg)
{
    // requests are broadcast, but only the addressee answers
    if(!util::iequals(msg.peer_id, channels_.local_peer_id())) {
        return;
    }
    seeding_responder_.on_piece_request(channel, msg.file_id, msg.piece_index);
}

void engine::handle_file_piece(const protocol::message& msg)
{
    if(util::iequals(msg.peer_id, channels_.local_peer_id())) {
        return;
    }
    if(auto t = find_transfer(msg.file_id)) {
        t->on_piece(msg.piece_index, msg.peer_id, msg.data);
    }
}

// -- seed store --

void engine::persist(const channel_ref& channel, const file_metadata& metadata,
        std::shared_ptr<const byte_source> source)
{
    const auto privacy = channels_.privacy(channel);
    if(!seed_store_.is_eligible(privacy)) {
        log(log_event::storage, log::priority::low, "not persisting %s",
                metadata.file_id.c_str());
        return;
    }
    seed_record record;
    record.metadata = metadata;
    record.channel = channel;
    record.privacy = privacy;
    record.timestamp = to_unix_millis(system_clock::now());
    seed_store_.async_persist(std::move(record), std::move(source),
            [this, file_id = metadata.file_id](const error_code& error) {
                if(error) {
                    log(log_event::storage, log::priority::high,
                            "couldn't persist %s: %s", file_id.c_str(),
                            error.message().c_str());
                    alert_queue_.emplace<seed_persist_failed_alert>(file_id, error);
                    return;
                }
                if(auto* file = seeding_responder_.find(file_id)) {
                    file->is_persisted = true;
                }
                alert_queue_.emplace<seed_persisted_alert>(file_id);
            });
}

void engine::on_seed_evicted(const seed_record& record)
{
    const auto& file_id = record.metadata.file_id;
    seeding_responder_.remove(file_id);
    downloads_.erase(file_id);
    log(log_event::storage, "evicted %s", file_id.c_str());
    alert_queue_.emplace<seed_evicted_alert>(file_id);
}

void engine::remove_seed_file(const file_id_t& file_id, error_code& error)
{
    const bool was_seeding = seeding_responder_.remove(file_id);
    downloads_.erase(file_id);
    seed_store_.remove(file_id, error);
    if(error == seed_store_errc::record_not_found && was_seeding) {
        error.clear();
    }
}

void engine::clear_seed_files(error_code& error)
{
    for(const auto& file_id : seed_store_.file_ids()) {
        seeding_responder_.remove(file_id);
        downloads_.erase(file_id);
    }
    seed_store_.clear(error);
}

seed_store::stats engine::storage_stats() const
{
    return seed_store_.get_stats();
}

std::vector<seed_record> engine::seed_records_for_channel(const channel_ref& channel) const
{
    return seed_store_.records_for_channel(channel);
}

// -- alerts --

std::deque<std::unique_ptr<alert>> engine::alerts()
{
    return alert_queue_.extract_alerts();
}

void engine::set_alert_notify(std::function<void()> fn)
{
    alert_queue_.set_notify(std::move(fn));
}

// -- settings --

template <typename T, typename String>
void throw_if_below(const T& v, const T& min, const String& msg)
{
    if((v != values::none) && (v < min)) throw std::invalid_argument(msg);
}

template <typename T, typename String>
void throw_if_below_allow_unlimited(const T& v, const T& min, const String& msg)
{
    if((v != values::unlimited) && (v != values::none) && (v < min))
        throw std::invalid_argument(msg);
}

template <typename Duration, typename String>
void throw_if_not_positive(const Duration& d, const String& msg)
{
    if(d <= Duration::zero()) throw std::invalid_argument(msg);
}

settings engine::checked_settings(settings s)
{
    verify(s);
    fill_in_defaults(s);
    return s;
}

void engine::verify(const settings& s)
{
    verify(s.transfer);
    verify(s.discovery);
    verify(s.seed_store);

    throw_if_below(s.max_file_size, int64_t(1),
            "settings::max_file_size must be none or above 0");
    throw_if_below(s.concurrency, 1, "settings::concurrency must be none or above 0");
    throw_if_below_allow_unlimited(s.alert_queue_capacity, 1,
            "settings::alert_queue_capacity must be unlimited, none or above 0");
}

void engine::verify(const transfer_settings& s)
{
    throw_if_below(s.piece_size, 1, "transfer_settings::piece_size must be none or above 0");
    throw_if_below(s.max_concurrent_requests, 1,
            "transfer_settings::max_concurrent_requests must be at least 1");
    throw_if_below_allow_unlimited(s.max_piece_attempts, 1,
            "transfer_settings::max_piece_attempts must be unlimited or at least 1");
    throw_if_below_allow_unlimited(s.max_seeder_failures, 0,
            "transfer_settings::max_seeder_failures must be unlimited or at least 0");
    throw_if_below(s.in_memory_threshold, int64_t(0),
            "transfer_settings::in_memory_threshold must be at least 0");
    throw_if_not_positive(s.piece_request_timeout,
            "transfer_settings::piece_request_timeout must be positive");
    throw_if_not_positive(s.idle_reschedule_interval,
            "transfer_settings::idle_reschedule_interval must be positive");
    if(s.piece_retry_backoff_base < milliseconds(0)
            || s.piece_retry_backoff_max < s.piece_retry_backoff_base)
        throw std::invalid_argument(
                "transfer_settings::piece_retry_backoff_max must not be below"
                " transfer_settings::piece_retry_backoff_base");
}

void engine::verify(const discovery_settings& s)
{
    throw_if_below(
            s.min_seeders, 1, "discovery_settings::min_seeders must be at least 1");
    throw_if_below(s.preferred_seeders, s.min_seeders,
            "discovery_settings::preferred_seeders must not be below"
            " discovery_settings::min_seeders");
    throw_if_below(s.max_seeder_requests, 1,
            "discovery_settings::max_seeder_requests must be at least 1");
    throw_if_not_positive(s.seeder_request_interval,
            "discovery_settings::seeder_request_interval must be positive");
    throw_if_not_positive(s.seeder_discovery_timeout,
            "discovery_settings::seeder_discovery_timeout must be positive");
    throw_if_not_positive(s.seeder_refresh_interval,
            "discovery_settings::seeder_refresh_interval must be positive");
}

void engine::verify(const seed_store_settings& s)
{
    throw_if_below(s.max_seed_storage, int64_t(0),
            "seed_store_settings::max_seed_storage must be none or at least 0");
    throw_if_below(s.seed_files_expire_days, 0,
            "seed_store_settings::seed_files_expire_days must be at least 0");
}

void engine::fill_in_defaults(settings& s)
{
    using values::none;

    auto set_if_none = [](auto& setting, auto val) {
        if(setting == none) setting = val;
    };

    set_if_none(s.max_file_size, int64_t(500) * 1024 * 1024);
    set_if_none(s.concurrency, 2);
    set_if_none(s.alert_queue_capacity, 1000);
    set_if_none(s.transfer.piece_size, 128 * 1024);
    set_if_none(s.seed_store.max_seed_storage, int64_t(500) * 1024 * 1024);
}

template <typename... Args>
void engine::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void engine::log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const
{
#ifdef SHOAL_ENABLE_LOGGING
    const auto header = [event]() -> std::string {
        switch(event) {
        case log_event::upload: return "UPLOAD";
        case log_event::download: return "DOWNLOAD";
        case log_event::message: return "MESSAGE";
        case log_event::seed: return "SEED";
        case log_event::storage: return "STORAGE";
        default: return "";
        }
    }();
    log::log_engine(header, util::format(format, std::forward<Args>(args)...), priority);
#endif // SHOAL_ENABLE_LOGGING
}

} // namespace shoal
