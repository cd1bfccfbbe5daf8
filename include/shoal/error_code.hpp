#ifndef SHOAL_ERROR_CODE_HEADER
#define SHOAL_ERROR_CODE_HEADER

#include <system_error>

namespace shoal {

using std::errc;
using std::error_category;
using std::error_code;
using std::error_condition;
using std::generic_category;
using std::is_error_code_enum;
using std::is_error_condition_enum;
using std::make_error_code;
using std::make_error_condition;
using std::system_category;
using std::system_error;

} // namespace shoal

#endif // SHOAL_ERROR_CODE_HEADER
