/***
 * Name: labelkit::exceptions::LabelkitException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "labelkit/exceptions/labelkit_exception.h"

namespace labelkit::exceptions {

const char* LabelkitException::what() const noexcept { return message_.c_str(); }

}  // namespace labelkit::exceptions
