#include "transfer.hpp"
#include "transfer_error.hpp"
#include "sha256_hasher.hpp"
#include "string_utils.hpp"
#include "alert_queue.hpp"
#include "transport.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <cmath>

namespace shoal {

#define SHARED_THIS this, self(shared_from_this())

transfer::transfer(asio::io_context& ios, transport& transport, alert_queue& alerts,
        const settings& settings, file_metadata metadata,
        std::unique_ptr<piece_storage> storage, channel_ref channel, channel_key key,
        peer_id_t local_peer_id, uint64_t generation, finished_handler handler)
    : ios_(ios)
    , transport_(transport)
    , alert_queue_(alerts)
    , settings_(settings)
    , metadata_(std::move(metadata))
    , channel_(std::move(channel))
    , key_(std::move(key))
    , local_peer_id_(std::move(local_peer_id))
    , generation_(generation)
    , storage_(std::move(storage))
    , pieces_(metadata_.num_pieces,
              piece_state(exponential_backoff<milliseconds>(
                      settings.transfer.piece_retry_backoff_base,
                      settings.transfer.piece_retry_backoff_max)))
    , discovery_(settings.discovery)
    , discovery_timer_(ios)
    , reschedule_timer_(ios)
    , finished_handler_(std::move(handler))
{}

void transfer::start()
{
    if(!is_active() || discovery_.num_requests() > 0) {
        return;
    }
    discovery_.start(clock::now());
    log(log_event::discovery, "looking for seeders of '%s' (%lld bytes, %d pieces)",
            metadata_.file_name.c_str(), static_cast<long long>(metadata_.file_size),
            metadata_.num_pieces);
    transport_.broadcast(
            channel_, protocol::encode_source_request(metadata_.file_id), key_);
    start_timer(discovery_timer_, settings_.discovery.seeder_request_interval,
            [SHARED_THIS](const error_code& error) { on_discovery_timer(error); });
}

void transfer::abort()
{
    if(!is_active()) {
        return;
    }
    state_ = transfer_info::cancelled;
    stop_timers();
    in_flight_.clear();
    finished_handler_ = nullptr;
    // a spilled file is removed along with its storage
    storage_.reset();
    log(log_event::complete, "aborted with %d/%d pieces", num_received_pieces_,
            metadata_.num_pieces);
}

transfer_info transfer::info() const
{
    transfer_info info;
    info.file_id = metadata_.file_id;
    info.state = state_;
    info.num_pieces = metadata_.num_pieces;
    info.num_received_pieces = num_received_pieces_;
    info.num_pending_pieces = std::count_if(pieces_.begin(), pieces_.end(),
            [](const auto& p) { return p.status == piece_status::pending; });
    info.num_in_flight = in_flight_.size();
    info.num_seeders = discovery_.num_seeders();
    info.num_source_requests = discovery_.num_requests();
    info.num_failed_attempts = num_failed_attempts_;
    return info;
}

// -- discovery --

void transfer::on_discovery_timer(const error_code& error)
{
    if(error == asio::error::operation_aborted || !is_active()) {
        return;
    }

    const auto action = discovery_.poll(clock::now());
    if(action.request_sources) {
        log(log_event::discovery, "requesting sources (%d seeders, request #%d)",
                discovery_.num_seeders(), discovery_.num_requests());
        transport_.broadcast(
                channel_, protocol::encode_source_request(metadata_.file_id), key_);
    }
    if(action.start_download) {
        start_download();
    }
    if(action.timed_out) {
        log(log_event::discovery, log::priority::high,
                "discovery timed out without seeders");
        if(settings_.discovery.no_seeders
                == discovery_settings::no_seeder_policy::fail) {
            finish(transfer_errc::no_seeders_found, nullptr);
            return;
        }
    }
    if(action.keep_polling && is_active()) {
        start_timer(discovery_timer_, settings_.discovery.seeder_request_interval,
                [SHARED_THIS](const error_code& error) { on_discovery_timer(error); });
    }
}

void transfer::on_source_announce(const peer_id_t& seeder)
{
    if(!is_active() || util::iequals(seeder, local_peer_id_)) {
        return;
    }
    if(!discovery_.add_seeder(seeder)) {
        return;
    }
    log(log_event::discovery, "new seeder %s (%d total)", seeder.c_str(),
            discovery_.num_seeders());
    post_seeder_update();
    if(discovery_.should_start_download()) {
        start_download();
    } else if(discovery_.is_download_started()) {
        manage_download();
    }
}

void transfer::start_download()
{
    discovery_.mark_download_started();
    state_ = transfer_info::downloading;
    log(log_event::request, "starting download with %d seeders",
            discovery_.num_seeders());
    alert_queue_.emplace<download_started_alert>(metadata_.file_id);
    manage_download();
}

void transfer::request_sources(const char* reason)
{
    discovery_.record_request(clock::now());
    log(log_event::discovery, "requesting sources (%s)", reason);
    transport_.broadcast(
            channel_, protocol::encode_source_request(metadata_.file_id), key_);
}

// -- scheduling --

void transfer::manage_download()
{
    if(!is_active()) {
        return;
    }

    const auto now = clock::now();
    if(discovery_.seeders().empty()) {
        // we lost (or banned) every seeder since the download started
        if(discovery_.is_download_started() && discovery_.should_refresh(now)) {
            request_sources("no seeders left");
        }
        schedule_manage_download(now + settings_.transfer.idle_reschedule_interval);
        return;
    }

    const int max_in_flight = settings_.transfer.max_concurrent_requests;
    time_point next_retry = time_point::max();
    for(piece_index_t i = 0; i < metadata_.num_pieces; ++i) {
        if(int(in_flight_.size()) >= max_in_flight) {
            break;
        }
        auto& piece = pieces_[i];
        if(piece.status != piece_status::pending) {
            continue;
        }
        if(piece.retry_after > now) {
            next_retry = std::min(next_retry, piece.retry_after);
            continue;
        }
        request_piece(i, next_seeder());
    }

    if(next_retry != time_point::max()) {
        schedule_manage_download(next_retry);
    }
    if(discovery_.should_refresh(now)) {
        request_sources("refreshing seeders");
    }
}

const peer_id_t& transfer::next_seeder() noexcept
{
    const auto& seeders = discovery_.seeders();
    return seeders[round_robin_cursor_++ % seeders.size()];
}

void transfer::request_piece(const piece_index_t index, const peer_id_t& seeder)
{
    pieces_[index].status = piece_status::requested;

    const uint64_t serial = next_request_serial_++;
    auto timer = std::make_unique<deadline_timer>(ios_);
    start_timer(*timer, settings_.transfer.piece_request_timeout,
            [SHARED_THIS, index, serial](const error_code& error) {
                if(error != asio::error::operation_aborted) {
                    on_request_timeout(index, serial);
                }
            });
    in_flight_.erase(index);
    in_flight_.emplace(index, piece_request{seeder, serial, std::move(timer)});

    log(log_event::request, log::priority::low, "requesting piece %d from %s (%d in flight)",
            index, seeder.c_str(), int(in_flight_.size()));
    transport_.broadcast(channel_,
            protocol::encode_piece_request(metadata_.file_id, index, seeder), key_);
}

void transfer::schedule_manage_download(const time_point when)
{
    const auto now = clock::now();
    if(reschedule_time_ > now && reschedule_time_ <= when) {
        // an earlier wakeup is already due
        return;
    }
    reschedule_time_ = when;
    reschedule_timer_.expires_at(when);
    reschedule_timer_.async_wait([SHARED_THIS](const error_code& error) {
        if(error == asio::error::operation_aborted) {
            return;
        }
        reschedule_time_ = time_point::max();
        manage_download();
    });
}

void transfer::on_request_timeout(const piece_index_t index, const uint64_t serial)
{
    if(!is_active()) {
        return;
    }
    auto it = in_flight_.find(index);
    if(it == in_flight_.end() || it->second.serial != serial
            || pieces_[index].status != piece_status::requested) {
        // the piece arrived or was re-requested in the meantime
        return;
    }
    const peer_id_t seeder = it->second.seeder;
    in_flight_.erase(it);
    log(log_event::request, log::priority::high, "request for piece %d from %s timed out",
            index, seeder.c_str());
    handle_failed_piece(index, seeder);
    manage_download();
}

void transfer::handle_failed_piece(const piece_index_t index, const peer_id_t& seeder)
{
    auto& piece = pieces_[index];
    piece.status = piece_status::pending;
    ++piece.num_failures;
    ++num_failed_attempts_;
    record_seeder_failure(seeder);

    const int max_attempts = settings_.transfer.max_piece_attempts;
    if(max_attempts > 0 && piece.num_failures >= max_attempts) {
        log(log_event::request, log::priority::high,
                "piece %d failed %d times, giving up", index, piece.num_failures);
        finish(transfer_errc::piece_retries_exhausted, nullptr);
        return;
    }

    // the first retry is immediate, as it most likely goes to a different seeder
    if(piece.num_failures > 1) {
        piece.retry_after = clock::now() + piece.backoff();
    }
}

void transfer::record_seeder_failure(const peer_id_t& seeder)
{
    const int max_failures = settings_.transfer.max_seeder_failures;
    if(max_failures <= 0) {
        return;
    }
    const auto id = util::to_lower_copy(seeder);
    if(++seeder_failures_[id] < max_failures) {
        return;
    }
    if(discovery_.ban_seeder(id)) {
        log(log_event::discovery, log::priority::high, "banning seeder %s after %d failures",
                id.c_str(), seeder_failures_[id]);
        post_seeder_update();
    }
}

// -- receiving --

void transfer::on_piece(
        const piece_index_t index, const peer_id_t& sender, const_view<uint8_t> data)
{
    if(!is_active() || index < 0 || index >= metadata_.num_pieces) {
        return;
    }
    auto& piece = pieces_[index];
    auto it = in_flight_.find(index);
    if(piece.status != piece_status::requested || it == in_flight_.end()) {
        log(log_event::receive, log::priority::low,
                "dropping unrequested piece %d from %s", index, sender.c_str());
        return;
    }

    if(int(data.size()) != metadata_.piece_length(index)) {
        log(log_event::verify, log::priority::high,
                "piece %d from %s has invalid length %d", index, sender.c_str(),
                int(data.size()));
        in_flight_.erase(it);
        handle_failed_piece(index, sender);
        manage_download();
        return;
    }

    if(create_sha256_digest(data) != metadata_.piece_hashes[index]) {
        log(log_event::verify, log::priority::high,
                "piece %d from %s failed hash verification", index, sender.c_str());
        in_flight_.erase(it);
        handle_failed_piece(index, sender);
        manage_download();
        return;
    }

    in_flight_.erase(it);
    error_code error;
    storage_->store(index, data, error);
    if(error) {
        log(log_event::receive, log::priority::high, "couldn't store piece %d: %s",
                index, error.message().c_str());
        finish(error, nullptr);
        return;
    }

    piece.status = piece_status::done;
    ++num_received_pieces_;
    log(log_event::receive, log::priority::low, "received piece %d from %s (%d/%d)",
            index, sender.c_str(), num_received_pieces_, metadata_.num_pieces);
    post_progress();

    if(num_received_pieces_ == metadata_.num_pieces) {
        on_all_pieces_received();
    } else {
        manage_download();
    }
}

void transfer::on_all_pieces_received()
{
    stop_timers();
    error_code error;
    auto file = storage_->assemble(error);
    storage_.reset();
    finish(error, std::move(file));
}

void transfer::finish(const error_code& error, std::shared_ptr<const byte_source> file)
{
    if(!is_active()) {
        return;
    }
    state_ = error ? transfer_info::failed : transfer_info::completed;
    stop_timers();
    in_flight_.clear();
    // the piece buffers belong to the engine's pool
    storage_.reset();
    if(error) {
        log(log_event::complete, log::priority::high, "failed: %s",
                error.message().c_str());
    } else {
        log(log_event::complete, log::priority::high, "download complete");
    }
    if(finished_handler_) {
        auto handler = std::move(finished_handler_);
        finished_handler_ = nullptr;
        handler(metadata_.file_id, generation_, error, std::move(file));
    }
}

void transfer::stop_timers()
{
    discovery_timer_.cancel();
    reschedule_timer_.cancel();
    reschedule_time_ = time_point::max();
}

void transfer::post_progress()
{
    const int percent = static_cast<int>(
            std::round(100.0 * num_received_pieces_ / metadata_.num_pieces));
    alert_queue_.emplace<transfer_progress_alert>(metadata_.file_id, percent,
            num_received_pieces_, metadata_.num_pieces, metadata_.file_size);
}

void transfer::post_seeder_update()
{
    alert_queue_.emplace<seeder_update_alert>(
            metadata_.file_id, discovery_.num_seeders());
}

template <typename... Args>
void transfer::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void transfer::log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const
{
#ifdef SHOAL_ENABLE_LOGGING
    const auto header = [event]() -> std::string {
        switch(event) {
        case log_event::discovery: return "DISCOVERY";
        case log_event::request: return "REQUEST";
        case log_event::receive: return "RECEIVE";
        case log_event::verify: return "VERIFY";
        case log_event::complete: return "COMPLETE";
        default: return "";
        }
    }();
    log::log_transfer(metadata_.file_id, header,
            util::format(format, std::forward<Args>(args)...), priority);
#endif // SHOAL_ENABLE_LOGGING
}

#undef SHARED_THIS

} // namespace shoal
