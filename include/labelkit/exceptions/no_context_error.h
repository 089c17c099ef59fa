/***
 * Name: labelkit::exceptions::NoContextError
 * Purpose: Raised when a context stack key is popped or peeked while empty.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from LabelkitException.
 */
#pragma once

#include <string>
#include <utility>

#include "labelkit/exceptions/labelkit_exception.h"

namespace labelkit {
namespace exceptions {

class NoContextError : public LabelkitException {
 public:
  explicit NoContextError(std::string msg) noexcept : LabelkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace labelkit
