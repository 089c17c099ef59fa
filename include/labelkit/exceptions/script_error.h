/***
 * Name: labelkit::exceptions::ScriptError
 * Purpose: Exception for malformed or misused label scripts.
 * Inputs: 1-based line number and error message
 * Outputs: Exception object; what() is prefixed with "line N: "
 * Theory of Operation: Keeps the line number separately for callers that
 *   want to report it in their own format.
 */
#pragma once

#include <string>

#include "labelkit/exceptions/labelkit_exception.h"

namespace labelkit {
namespace exceptions {

class ScriptError : public LabelkitException {
 public:
  ScriptError(int line, const std::string& msg)
      : LabelkitException("line " + std::to_string(line) + ": " + msg), line_(line) {}

  int line() const noexcept { return line_; }

 private:
  int line_;
};

}  // namespace exceptions
}  // namespace labelkit
