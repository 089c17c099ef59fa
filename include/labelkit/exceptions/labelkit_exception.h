/***
 * Name: labelkit::exceptions::LabelkitException
 * Purpose: Base class for all labelkit exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in labelkit must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace labelkit {
namespace exceptions {

class LabelkitException : public std::exception {
 public:
  virtual ~LabelkitException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit LabelkitException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace labelkit
