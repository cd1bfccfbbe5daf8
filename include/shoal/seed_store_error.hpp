#ifndef SHOAL_SEED_STORE_ERROR_HEADER
#define SHOAL_SEED_STORE_ERROR_HEADER

#include <system_error>
#include <string>

namespace shoal {

enum class seed_store_errc
{
    unknown = 1,
    // Persistence is disabled (no store path) or not allowed for this channel class.
    not_eligible,
    // The file does not fit in the quota even after evicting every evictable record.
    quota_exceeded,
    corrupt_record,
    record_not_found,
    size_mismatch,
    // The record was removed while it was still being written.
    write_cancelled
};

struct seed_store_error_category : public std::error_category
{
    const char* name() const noexcept override { return "seed_store"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const seed_store_error_category& seed_store_category();
std::error_code make_error_code(seed_store_errc e);
std::error_condition make_error_condition(seed_store_errc e);

} // namespace shoal

namespace std {
template <>
struct is_error_code_enum<shoal::seed_store_errc> : public true_type
{};
} // namespace std

#endif // SHOAL_SEED_STORE_ERROR_HEADER
