#include "protocol_error.hpp"

namespace shoal {

std::string protocol_error_category::message(int env) const
{
    switch(static_cast<protocol_errc>(env)) {
    case protocol_errc::truncated_message: return "Truncated message";
    case protocol_errc::unsupported_version: return "Unsupported protocol version";
    case protocol_errc::unknown_message_type: return "Unknown message type";
    case protocol_errc::invalid_field: return "Invalid message field";
    case protocol_errc::trailing_bytes: return "Trailing bytes after message";
    default: return "Unknown";
    }
}

std::error_condition protocol_error_category::default_error_condition(int ev) const noexcept
{
    return std::error_condition(ev, *this);
}

const protocol_error_category& protocol_category()
{
    static protocol_error_category instance;
    return instance;
}

std::error_code make_error_code(protocol_errc e)
{
    return std::error_code(static_cast<int>(e), protocol_category());
}

std::error_condition make_error_condition(protocol_errc e)
{
    return std::error_condition(static_cast<int>(e), protocol_category());
}

} // namespace shoal
