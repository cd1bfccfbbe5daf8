#include "seed_store_error.hpp"

namespace shoal {

std::string seed_store_error_category::message(int env) const
{
    switch(static_cast<seed_store_errc>(env)) {
    case seed_store_errc::not_eligible: return "File is not eligible for persistence";
    case seed_store_errc::quota_exceeded: return "Seed storage quota exceeded";
    case seed_store_errc::corrupt_record: return "Corrupt seed record";
    case seed_store_errc::record_not_found: return "Seed record not found";
    case seed_store_errc::size_mismatch: return "Seed data size does not match metadata";
    case seed_store_errc::write_cancelled: return "Seed record removed while being written";
    default: return "Unknown";
    }
}

std::error_condition seed_store_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<seed_store_errc>(ev)) {
    case seed_store_errc::quota_exceeded:
        return std::make_error_condition(std::errc::no_space_on_device);
    case seed_store_errc::write_cancelled:
        return std::make_error_condition(std::errc::operation_canceled);
    default: return std::error_condition(ev, *this);
    }
}

const seed_store_error_category& seed_store_category()
{
    static seed_store_error_category instance;
    return instance;
}

std::error_code make_error_code(seed_store_errc e)
{
    return std::error_code(static_cast<int>(e), seed_store_category());
}

std::error_condition make_error_condition(seed_store_errc e)
{
    return std::error_condition(static_cast<int>(e), seed_store_category());
}

} // namespace shoal
