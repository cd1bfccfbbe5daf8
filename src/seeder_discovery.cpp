#include "seeder_discovery.hpp"
#include "string_utils.hpp"

#include <algorithm>

namespace shoal {

seeder_discovery::seeder_discovery(const discovery_settings& settings)
    : settings_(settings)
{}

void seeder_discovery::start(const time_point now)
{
    start_time_ = now;
    record_request(now);
}

seeder_discovery::action seeder_discovery::poll(const time_point now)
{
    action a;
    if(num_seeders() < settings_.preferred_seeders
            && num_requests_ < settings_.max_seeder_requests
            && now - last_request_time_ >= settings_.seeder_request_interval) {
        record_request(now);
        a.request_sources = true;
    }

    if(should_start_download()) {
        a.start_download = true;
    }

    const bool will_start = is_download_started_ || a.start_download;
    if(!will_start || num_seeders() < settings_.preferred_seeders) {
        if(now - start_time_ < settings_.seeder_discovery_timeout) {
            a.keep_polling = true;
        } else if(!will_start && seeders_.empty()) {
            // one last attempt, in case the earlier requests were all lost
            if(!a.request_sources) {
                record_request(now);
                a.request_sources = true;
            }
            a.timed_out = true;
        }
    }
    return a;
}

bool seeder_discovery::add_seeder(const peer_id_t& seeder)
{
    auto id = util::to_lower_copy(seeder);
    if(banned_seeders_.count(id) > 0
            || std::find(seeders_.begin(), seeders_.end(), id) != seeders_.end()) {
        return false;
    }
    seeders_.emplace_back(std::move(id));
    return true;
}

bool seeder_discovery::ban_seeder(const peer_id_t& seeder)
{
    auto id = util::to_lower_copy(seeder);
    auto it = std::find(seeders_.begin(), seeders_.end(), id);
    const bool was_seeder = it != seeders_.end();
    if(was_seeder) {
        seeders_.erase(it);
    }
    banned_seeders_.emplace(std::move(id));
    return was_seeder;
}

bool seeder_discovery::should_start_download() const noexcept
{
    return !is_download_started_ && num_seeders() >= settings_.min_seeders;
}

bool seeder_discovery::should_refresh(const time_point now) const noexcept
{
    return num_seeders() < settings_.preferred_seeders
            && num_requests_ < settings_.max_seeder_requests
            && now - last_request_time_ > settings_.seeder_refresh_interval;
}

void seeder_discovery::record_request(const time_point now) noexcept
{
    last_request_time_ = now;
    ++num_requests_;
}

bool seeder_discovery::is_banned(const peer_id_t& seeder) const
{
    return banned_seeders_.count(util::to_lower_copy(seeder)) > 0;
}

} // namespace shoal
