#ifndef SHOAL_ALERTS_HEADER
#define SHOAL_ALERTS_HEADER

#include "file_metadata.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"
#include "time.hpp"
#include "types.hpp"

#include <type_traits>
#include <memory>

namespace shoal {

/** This is the interface all alerts must implement. */
struct alert
{
    enum category
    {
        error = 1,
        // Results of operations that run in the background, such as hashing an
        // upload.
        async_result = 2,
        transfer = 4,
        storage = 8,
        progress = 16,
        discovery = 32
    };

    // The time this alert was posted.
    time_point time;

    alert() : time(clock::now()) {}
    alert(const alert&) = default;
    alert& operator=(const alert&) = default;
    alert(alert&&) = default;
    alert& operator=(alert&&) = default;
    virtual ~alert() {}

    virtual int category() const noexcept = 0;
};

/** Generic alert to report errors of asynchronous operations. */
struct error_alert : public alert
{
    error_code error;
    explicit error_alert(error_code ec) : error(ec) {}
    int category() const noexcept override { return category::error; }
};

// -- upload related alerts --

struct file_hashed_alert final : public alert
{
    channel_ref channel;
    file_metadata metadata;
    file_hashed_alert(channel_ref c, file_metadata m)
        : channel(std::move(c)), metadata(std::move(m))
    {}
    int category() const noexcept override { return async_result; }
};

struct hashing_failed_alert final : public error_alert
{
    std::string file_name;
    hashing_failed_alert(std::string name, error_code ec)
        : error_alert(ec), file_name(std::move(name))
    {}
    int category() const noexcept override
    {
        return alert::error | alert::async_result;
    }
};

// -- download related alerts --

/** Base class for all alerts concerning a single download. */
struct transfer_alert : public alert
{
    file_id_t file_id;
    explicit transfer_alert(file_id_t id) : file_id(std::move(id)) {}
    int category() const noexcept override { return transfer; }
};

struct download_started_alert final : public transfer_alert
{
    explicit download_started_alert(file_id_t id) : transfer_alert(std::move(id)) {}
};

struct seeder_update_alert final : public transfer_alert
{
    int num_seeders;
    seeder_update_alert(file_id_t id, int n)
        : transfer_alert(std::move(id)), num_seeders(n)
    {}
    int category() const noexcept override
    {
        return transfer_alert::category() | discovery;
    }
};

struct transfer_progress_alert final : public transfer_alert
{
    // Rounded to the nearest whole percent.
    int percent;
    int num_received_pieces;
    int num_pieces;
    int64_t file_size;

    transfer_progress_alert(
            file_id_t id, int percent_, int received, int pieces, int64_t size)
        : transfer_alert(std::move(id))
        , percent(percent_)
        , num_received_pieces(received)
        , num_pieces(pieces)
        , file_size(size)
    {}

    int category() const noexcept override
    {
        return transfer_alert::category() | progress;
    }
};

struct download_complete_alert final : public transfer_alert
{
    file_metadata metadata;
    std::shared_ptr<const byte_source> file;

    download_complete_alert(file_metadata m, std::shared_ptr<const byte_source> f)
        : transfer_alert(m.file_id), metadata(std::move(m)), file(std::move(f))
    {}
};

struct transfer_failed_alert final : public transfer_alert
{
    error_code error;
    transfer_failed_alert(file_id_t id, error_code ec)
        : transfer_alert(std::move(id)), error(ec)
    {}
    int category() const noexcept override
    {
        return transfer_alert::category() | category::error;
    }
};

struct transfer_cancelled_alert final : public transfer_alert
{
    explicit transfer_cancelled_alert(file_id_t id) : transfer_alert(std::move(id)) {}
};

// -- seed store related alerts --

struct storage_alert : public alert
{
    int category() const noexcept override { return storage; }
};

struct seed_persisted_alert final : public storage_alert
{
    file_id_t file_id;
    explicit seed_persisted_alert(file_id_t id) : file_id(std::move(id)) {}
};

struct seed_persist_failed_alert final : public storage_alert
{
    file_id_t file_id;
    error_code error;
    seed_persist_failed_alert(file_id_t id, error_code ec)
        : file_id(std::move(id)), error(ec)
    {}
    int category() const noexcept override
    {
        return storage_alert::category() | category::error;
    }
};

struct seed_evicted_alert final : public storage_alert
{
    file_id_t file_id;
    explicit seed_evicted_alert(file_id_t id) : file_id(std::move(id)) {}
};

struct seeds_loaded_alert final : public storage_alert
{
    int num_loaded;
    int num_expired;
    seeds_loaded_alert(int loaded, int expired) : num_loaded(loaded), num_expired(expired)
    {}
};

/** Convenience method to cast an alert to the specified one. */
template <typename T>
T* alert_cast(alert* a)
{
    static_assert(std::is_base_of<alert, T>::value,
            "alert_cast may only be used with types inheriting from alert");
    return dynamic_cast<T*>(a);
}

} // namespace shoal

#endif // SHOAL_ALERTS_HEADER
