/***
 * Name: labelkit::exceptions::UnresolvedScopeError
 * Purpose: Raised when a scope's full name is queried before it was ever entered.
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

class UnresolvedScopeError : public LabelkitException {
 public:
  explicit UnresolvedScopeError(std::string msg) noexcept : LabelkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace labelkit
