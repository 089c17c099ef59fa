/***
 * Name: labelkit::label::ValidateLabelName
 * Purpose: Reject empty segments and segments containing the separator.
 * Inputs:
 *   - name: segment text
 *   - options: environment options (underscore policy)
 * Outputs: None; throws ValidationError
 * Theory of Operation: Checked eagerly at construction/use time.
 */
#include "labelkit/label/validate.h"

#include <string>
#include <string_view>

#include "labelkit/exceptions/validation_error.h"

namespace labelkit::label {

void ValidateLabelName(std::string_view name, const config::LabelOptions& options) {
  if (name.empty()) {
    throw exceptions::ValidationError("label cannot be empty");
  }
  if (name.find(kSeparator) != std::string_view::npos) {
    throw exceptions::ValidationError("label '" + std::string(name) +
                                      "' cannot contain slash (`/`). Please use label scopes to build "
                                      "hierarchical labels.");
  }
  if (options.forbid_underscore && name.find('_') != std::string_view::npos) {
    throw exceptions::ValidationError("label '" + std::string(name) + "' cannot contain underscore (`_`)");
  }
}

}  // namespace labelkit::label
