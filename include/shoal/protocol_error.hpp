#ifndef SHOAL_PROTOCOL_ERROR_HEADER
#define SHOAL_PROTOCOL_ERROR_HEADER

#include <system_error>
#include <string>

namespace shoal {

enum class protocol_errc
{
    unknown = 1,
    // The message ended before all of its fields could be read.
    truncated_message,
    unsupported_version,
    unknown_message_type,
    // A field was read but its value is not valid (e.g. a negative piece index).
    invalid_field,
    // Bytes remained after the last field of the message.
    trailing_bytes
};

struct protocol_error_category : public std::error_category
{
    const char* name() const noexcept override { return "protocol"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const protocol_error_category& protocol_category();
std::error_code make_error_code(protocol_errc e);
std::error_condition make_error_condition(protocol_errc e);

} // namespace shoal

namespace std {
template <>
struct is_error_code_enum<shoal::protocol_errc> : public true_type
{};
} // namespace std

#endif // SHOAL_PROTOCOL_ERROR_HEADER
