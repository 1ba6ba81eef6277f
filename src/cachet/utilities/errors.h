#ifndef CACHET_UTILITIES_ERRORS_H
#define CACHET_UTILITIES_ERRORS_H

#include <cachet/core/exception.h>

namespace cachet {

// If an error occurs internally within a library that provides its own
// error messages, this is used to convey that message.
CACHET_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace cachet

#endif
