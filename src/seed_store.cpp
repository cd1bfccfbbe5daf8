#include "seed_store.hpp"
#include "seed_store_error.hpp"
#include "string_utils.hpp"
#include "thread_pool.hpp"
#include "scope_guard.hpp"
#include "payload.hpp"
#include "system.hpp"
#include "log.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shoal {

// "SHSD"
constexpr uint32_t seed_record_magic = 0x53485344;
constexpr uint8_t seed_record_version = 1;

constexpr char header_extension[] = ".seed";
constexpr char data_extension[] = ".data";
constexpr char temporary_extension[] = ".tmp";

std::vector<uint8_t> encode_seed_record(const seed_record& record)
{
    const auto metadata = encode_metadata(record.metadata);
    payload payload(4 + 1 + 2 + record.channel.size() + 1 + 8 + 4 + metadata.size());
    payload.u32(seed_record_magic)
            .u8(seed_record_version)
            .string(record.channel)
            .u8(static_cast<uint8_t>(record.privacy))
            .i64(record.timestamp)
            .blob(metadata);
    return std::move(payload.data);
}

seed_record decode_seed_record(const_view<uint8_t> buffer, error_code& error)
{
    error.clear();
    payload_reader reader(buffer);
    const auto magic = reader.u32();
    const auto version = reader.u8();
    seed_record record;
    record.channel = reader.string();
    const auto privacy = reader.u8();
    record.timestamp = reader.i64();
    const auto metadata = reader.blob();
    if(!reader.ok() || reader.remaining() > 0 || magic != seed_record_magic
            || version != seed_record_version || privacy > 1) {
        error = make_error_code(seed_store_errc::corrupt_record);
        return {};
    }
    record.privacy = static_cast<channel_privacy>(privacy);
    record.metadata = decode_metadata(metadata, error);
    if(error) {
        error = make_error_code(seed_store_errc::corrupt_record);
        return {};
    }
    return record;
}

// Raw POSIX I/O for the record files. These run on the thread pool.
namespace {

void write_file(const path& path, const_view<uint8_t> data, error_code& error)
{
    error.clear();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if(fd == -1) {
        error = system::last_error();
        return;
    }
    const uint8_t* buffer = data.data();
    size_t num_left = data.size();
    while(num_left > 0) {
        const ssize_t n = ::write(fd, buffer, num_left);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }
            error = system::last_error();
            ::close(fd);
            return;
        }
        buffer += n;
        num_left -= n;
    }
    if(::fsync(fd) != 0) {
        error = system::last_error();
    }
    ::close(fd);
}

std::vector<uint8_t> read_file(const path& path, error_code& error)
{
    error.clear();
    const int fd = ::open(path.c_str(), O_RDONLY);
    if(fd == -1) {
        error = system::last_error();
        return {};
    }
    struct stat st;
    if(::fstat(fd, &st) != 0) {
        error = system::last_error();
        ::close(fd);
        return {};
    }
    std::vector<uint8_t> contents(st.st_size);
    size_t num_read = 0;
    while(num_read < contents.size()) {
        const ssize_t n = ::read(fd, &contents[num_read], contents.size() - num_read);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }
            error = system::last_error();
            break;
        } else if(n == 0) {
            // the file was truncated under us
            contents.resize(num_read);
            break;
        }
        num_read += n;
    }
    ::close(fd);
    return contents;
}

/**
 * Writes both files of a record under their temporary names and renames them into
 * place, contents first. On failure nothing is left behind.
 */
void write_record(const path& data_path, const path& header_path,
        const seed_record& record, const byte_source& source, error_code& error)
{
    path data_tmp = data_path;
    data_tmp += temporary_extension;
    path header_tmp = header_path;
    header_tmp += temporary_extension;

    util::scope_guard cleanup([&] {
        error_code ec;
        fs::remove(data_tmp, ec);
        fs::remove(header_tmp, ec);
        fs::remove(data_path, ec);
    });

    fs::create_directories(data_path.parent_path(), error);
    if(error) {
        return;
    }
    write_file(data_tmp, source.bytes(), error);
    if(error) {
        return;
    }
    const auto header = encode_seed_record(record);
    write_file(header_tmp, header, error);
    if(error) {
        return;
    }
    fs::rename(data_tmp, data_path, error);
    if(error) {
        return;
    }
    fs::rename(header_tmp, header_path, error);
    if(error) {
        return;
    }
    cleanup.disable();
}

} // namespace

seed_store::seed_store(asio::io_context& network_ios, thread_pool& thread_pool,
        const seed_store_settings& settings)
    : network_ios_(network_ios), thread_pool_(thread_pool), settings_(settings)
{}

bool seed_store::is_eligible(const channel_privacy privacy) const noexcept
{
    if(!is_enabled()) {
        return false;
    }
    return privacy == channel_privacy::open ? settings_.persist_public_channels
                                            : settings_.persist_private_channels;
}

std::vector<seed_store::loaded_record> seed_store::load(
        const system_time_point now, int& num_expired, error_code& error)
{
    error.clear();
    num_expired = 0;
    std::vector<loaded_record> loaded;
    if(!is_enabled()) {
        return loaded;
    }

    const auto& dir = settings_.seed_store_path;
    fs::create_directories(dir, error);
    if(error) {
        return loaded;
    }

    std::vector<path> headers;
    std::vector<path> data_files;
    for(fs::directory_iterator it(dir, error), end; !error && it != end;
            it.increment(error)) {
        const auto& p = it->path();
        const auto extension = p.extension().string();
        if(extension == temporary_extension) {
            // an interrupted write
            error_code ec;
            fs::remove(p, ec);
        } else if(extension == header_extension) {
            headers.emplace_back(p);
        } else if(extension == data_extension) {
            data_files.emplace_back(p);
        }
    }
    if(error) {
        return loaded;
    }

    const int64_t max_age
            = milliseconds(hours(24) * settings_.seed_files_expire_days).count();
    const int64_t now_ms = to_unix_millis(now);

    for(const auto& header : headers) {
        const file_id_t file_id = header.stem().string();
        error_code ec;
        const auto contents = read_file(header, ec);
        seed_record record;
        if(!ec) {
            record = decode_seed_record(contents, ec);
        }
        if(!ec && record.metadata.file_id != file_id) {
            ec = make_error_code(seed_store_errc::corrupt_record);
        }
        if(ec) {
            log(log::priority::high, "dropping corrupt record %s: %s",
                    header.c_str(), ec.message().c_str());
            delete_files(file_id, ec);
            continue;
        }

        if(now_ms - record.timestamp > max_age) {
            log("record %s expired", file_id.c_str());
            delete_files(file_id, ec);
            ++num_expired;
            continue;
        }

        auto source = map_file(data_path(file_id), ec);
        if(!ec && source->size() != record.metadata.file_size) {
            ec = make_error_code(seed_store_errc::size_mismatch);
        }
        if(ec) {
            log(log::priority::high, "dropping record %s, bad contents: %s",
                    file_id.c_str(), ec.message().c_str());
            delete_files(file_id, ec);
            continue;
        }

        loaded.push_back({record, std::move(source)});
        add_to_index(std::move(record));
    }

    // contents whose header never made it to disk
    for(const auto& data_file : data_files) {
        if(!contains(data_file.stem().string())) {
            error_code ec;
            fs::remove(data_file, ec);
        }
    }

    log("loaded %d records (%lld bytes), %d expired", int(records_.size()),
            static_cast<long long>(used_bytes_), num_expired);
    return loaded;
}

void seed_store::async_persist(seed_record record,
        std::shared_ptr<const byte_source> source, persist_handler handler)
{
    const auto complete = [this, &handler](const error_code& error) {
        asio::post(network_ios_, [token = std::weak_ptr<int>(lifetime_token_),
                                         handler = std::move(handler), error] {
            if(!token.expired()) {
                handler(error);
            }
        });
    };

    if(!is_eligible(record.privacy)) {
        complete(seed_store_errc::not_eligible);
        return;
    }

    const file_id_t file_id = record.metadata.file_id;
    if(!is_valid_file_id(file_id)) {
        complete(std::make_error_code(std::errc::invalid_argument));
        return;
    }
    if(is_cancelled(file_id)) {
        // the record is wanted after all, the pending write stands
        cancelled_writes_.erase(file_id);
        complete(error_code());
        return;
    }
    if(contains(file_id) || is_writing(file_id)) {
        complete(error_code());
        return;
    }

    const int64_t size = record.metadata.file_size;
    if(source == nullptr || source->size() != size) {
        complete(seed_store_errc::size_mismatch);
        return;
    }
    if(size > max_bytes()) {
        log("%s (%lld bytes) exceeds the quota", file_id.c_str(),
                static_cast<long long>(size));
        complete(seed_store_errc::quota_exceeded);
        return;
    }
    if(used_bytes_ + reserved_bytes_ + size > max_bytes()) {
        evict_oldest(size);
        if(used_bytes_ + reserved_bytes_ + size > max_bytes()) {
            log(log::priority::high, "couldn't free enough space for %s",
                    file_id.c_str());
            complete(seed_store_errc::quota_exceeded);
            return;
        }
    }

    if(record.timestamp == 0) {
        record.timestamp = to_unix_millis(system_clock::now());
    }

    pending_writes_.insert(file_id);
    reserved_bytes_ += size;
    log("writing %s (%lld bytes)", file_id.c_str(), static_cast<long long>(size));

    auto work = asio::make_work_guard(network_ios_);
    // `this` may be gone once the write is done
    thread_pool_.post([this, &network_ios = network_ios_, work = std::move(work),
                              token = std::weak_ptr<int>(lifetime_token_),
                              data_file = data_path(file_id),
                              header_file = header_path(file_id),
                              record = std::move(record), source = std::move(source),
                              handler = std::move(handler)]() mutable {
        error_code error;
        write_record(data_file, header_file, record, *source, error);
        if(error) {
#ifdef SHOAL_ENABLE_LOGGING
            log::log_storage("SEED_STORE",
                    util::format("couldn't write %s: %s",
                            record.metadata.file_id.c_str(), error.message().c_str()),
                    true, log::priority::high);
#endif // SHOAL_ENABLE_LOGGING
        }
        asio::post(network_ios,
                [this, token = std::move(token), record = std::move(record), error,
                        handler = std::move(handler)]() mutable {
                    if(token.expired()) {
                        return;
                    }
                    const auto file_id = record.metadata.file_id;
                    pending_writes_.erase(file_id);
                    reserved_bytes_ -= record.metadata.file_size;
                    if(cancelled_writes_.erase(file_id) > 0) {
                        error_code ec;
                        delete_files(file_id, ec);
                        log("discarded %s, removed while being written", file_id.c_str());
                        if(!error) {
                            error = make_error_code(seed_store_errc::write_cancelled);
                        }
                    } else if(!error) {
                        add_to_index(std::move(record));
                        log("persisted %s", file_id.c_str());
                    }
                    handler(error);
                });
        work.reset();
    });
}

void seed_store::remove(const file_id_t& file_id, error_code& error)
{
    error.clear();
    if(is_writing(file_id)) {
        if(cancelled_writes_.insert(file_id).second) {
            log("cancelling write of %s", file_id.c_str());
            return;
        }
        error = make_error_code(seed_store_errc::record_not_found);
        return;
    }
    if(!contains(file_id)) {
        error = make_error_code(seed_store_errc::record_not_found);
        return;
    }
    erase_from_index(file_id);
    delete_files(file_id, error);
    log("removed %s", file_id.c_str());
}

void seed_store::clear(error_code& error)
{
    error.clear();
    for(const auto& file_id : pending_writes_) {
        cancelled_writes_.insert(file_id);
    }
    while(!records_.empty()) {
        const auto file_id = records_.begin()->first;
        error_code ec;
        remove(file_id, ec);
        if(ec) {
            error = ec;
        }
    }
}

int64_t seed_store::evict_oldest(const int64_t num_bytes)
{
    int64_t num_freed = 0;
    while(num_freed < num_bytes && !by_timestamp_.empty()) {
        const auto file_id = by_timestamp_.begin()->second;
        const seed_record record = records_.at(file_id);
        erase_from_index(file_id);
        error_code ec;
        delete_files(file_id, ec);
        if(ec) {
            log(log::priority::high, "couldn't delete evicted %s: %s",
                    file_id.c_str(), ec.message().c_str());
        }
        num_freed += record.metadata.file_size;
        log("evicted %s (%lld bytes)", file_id.c_str(),
                static_cast<long long>(record.metadata.file_size));
        if(eviction_handler_) {
            eviction_handler_(record);
        }
    }
    return num_freed;
}

void seed_store::set_eviction_handler(eviction_handler handler)
{
    eviction_handler_ = std::move(handler);
}

bool seed_store::contains(const file_id_t& file_id) const
{
    return records_.find(file_id) != records_.end();
}

bool seed_store::is_writing(const file_id_t& file_id) const
{
    return pending_writes_.find(file_id) != pending_writes_.end();
}

bool seed_store::is_cancelled(const file_id_t& file_id) const
{
    return cancelled_writes_.find(file_id) != cancelled_writes_.end();
}

const seed_record* seed_store::find(const file_id_t& file_id) const
{
    auto it = records_.find(file_id);
    if(it == records_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<seed_record> seed_store::records_for_channel(const channel_ref& channel) const
{
    std::vector<seed_record> records;
    const auto range = by_channel_.equal_range(channel);
    for(auto it = range.first; it != range.second; ++it) {
        records.push_back(records_.at(it->second));
    }
    return records;
}

std::vector<file_id_t> seed_store::file_ids() const
{
    std::vector<file_id_t> ids;
    ids.reserve(records_.size() + pending_writes_.size());
    for(const auto& e : records_) {
        ids.emplace_back(e.first);
    }
    for(const auto& file_id : pending_writes_) {
        if(!is_cancelled(file_id)) {
            ids.emplace_back(file_id);
        }
    }
    return ids;
}

seed_store::stats seed_store::get_stats() const
{
    stats s;
    s.used_bytes = used_bytes_;
    s.max_bytes = max_bytes();
    s.num_records = records_.size();
    return s;
}

path seed_store::header_path(const file_id_t& file_id) const
{
    return settings_.seed_store_path / (file_id + header_extension);
}

path seed_store::data_path(const file_id_t& file_id) const
{
    return settings_.seed_store_path / (file_id + data_extension);
}

void seed_store::add_to_index(seed_record record)
{
    const auto file_id = record.metadata.file_id;
    by_timestamp_.emplace(record.timestamp, file_id);
    by_channel_.emplace(record.channel, file_id);
    used_bytes_ += record.metadata.file_size;
    records_.emplace(file_id, std::move(record));
}

void seed_store::erase_from_index(const file_id_t& file_id)
{
    auto it = records_.find(file_id);
    if(it == records_.end()) {
        return;
    }
    const auto& record = it->second;

    auto ts = by_timestamp_.equal_range(record.timestamp);
    for(auto i = ts.first; i != ts.second; ++i) {
        if(i->second == file_id) {
            by_timestamp_.erase(i);
            break;
        }
    }
    auto ch = by_channel_.equal_range(record.channel);
    for(auto i = ch.first; i != ch.second; ++i) {
        if(i->second == file_id) {
            by_channel_.erase(i);
            break;
        }
    }
    used_bytes_ -= record.metadata.file_size;
    records_.erase(it);
}

void seed_store::delete_files(const file_id_t& file_id, error_code& error)
{
    error.clear();
    // the header goes first so that a half deleted record is never loaded
    fs::remove(header_path(file_id), error);
    if(error) {
        return;
    }
    fs::remove(data_path(file_id), error);
}

template <typename... Args>
void seed_store::log(const char* format, Args&&... args) const
{
    log(log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void seed_store::log(
        const log::priority priority, const char* format, Args&&... args) const
{
#ifdef SHOAL_ENABLE_LOGGING
    log::log_storage("SEED_STORE", util::format(format, std::forward<Args>(args)...),
            false, priority);
#endif // SHOAL_ENABLE_LOGGING
}

} // namespace shoal
