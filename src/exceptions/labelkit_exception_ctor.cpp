/***
 * Name: labelkit::exceptions::LabelkitException::LabelkitException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "labelkit/exceptions/labelkit_exception.h"

#include <utility>

namespace labelkit {
namespace exceptions {

LabelkitException::LabelkitException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace labelkit
