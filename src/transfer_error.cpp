#include "transfer_error.hpp"

namespace shoal {

std::string transfer_error_category::message(int env) const
{
    switch(static_cast<transfer_errc>(env)) {
    case transfer_errc::empty_file: return "File is empty";
    case transfer_errc::file_too_large: return "File exceeds the maximum file size";
    case transfer_errc::hashing_failed: return "Failed to hash file";
    case transfer_errc::invalid_metadata: return "Invalid file metadata";
    case transfer_errc::no_seeders_found: return "No seeders found";
    case transfer_errc::piece_retries_exhausted: return "Piece retry limit reached";
    case transfer_errc::operation_aborted: return "Operation aborted";
    default: return "Unknown";
    }
}

std::error_condition transfer_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<transfer_errc>(ev)) {
    case transfer_errc::operation_aborted:
        return std::make_error_condition(std::errc::operation_canceled);
    default: return std::error_condition(ev, *this);
    }
}

const transfer_error_category& transfer_category()
{
    static transfer_error_category instance;
    return instance;
}

std::error_code make_error_code(transfer_errc e)
{
    return std::error_code(static_cast<int>(e), transfer_category());
}

std::error_condition make_error_condition(transfer_errc e)
{
    return std::error_condition(static_cast<int>(e), transfer_category());
}

} // namespace shoal
