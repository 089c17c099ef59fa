/***
 * Name: labelkit::exceptions::ContextTypeError
 * Purpose: Raised when a context value is retrieved as the wrong type.
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

class ContextTypeError : public LabelkitException {
 public:
  explicit ContextTypeError(std::string msg) noexcept : LabelkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace labelkit
