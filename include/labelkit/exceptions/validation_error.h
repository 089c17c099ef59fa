/***
 * Name: labelkit::exceptions::ValidationError
 * Purpose: Raised when a label or scope segment name is malformed.
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

class ValidationError : public LabelkitException {
 public:
  explicit ValidationError(std::string msg) noexcept : LabelkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace labelkit
