/***
 * Name: labelkit::exceptions::ScopeOrderError
 * Purpose: Raised when a label scope is exited while another scope is on top.
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

class ScopeOrderError : public LabelkitException {
 public:
  explicit ScopeOrderError(std::string msg) noexcept : LabelkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace labelkit
