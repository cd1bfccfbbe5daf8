#ifndef SHOAL_TRANSFER_ERROR_HEADER
#define SHOAL_TRANSFER_ERROR_HEADER

#include <system_error>
#include <string>

namespace shoal {

enum class transfer_errc
{
    unknown = 1,
    empty_file,
    file_too_large,
    hashing_failed,
    invalid_metadata,
    // Discovery timed out without a single seeder and the no-seeder policy is to fail.
    no_seeders_found,
    // A piece failed verification or timed out more times than allowed.
    piece_retries_exhausted,
    operation_aborted
};

struct transfer_error_category : public std::error_category
{
    const char* name() const noexcept override { return "transfer"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const transfer_error_category& transfer_category();
std::error_code make_error_code(transfer_errc e);
std::error_condition make_error_condition(transfer_errc e);

} // namespace shoal

namespace std {
template <>
struct is_error_code_enum<shoal::transfer_errc> : public true_type
{};
} // namespace std

#endif // SHOAL_TRANSFER_ERROR_HEADER
