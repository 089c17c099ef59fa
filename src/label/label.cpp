/***
 * Name: labelkit::label::Label (impl)
 * Purpose: Construction, printing and scope conversion for labels.
 */
#include "labelkit/label/label.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "labelkit/label/validate.h"
#include "labelkit/scope/label_scope.h"

namespace labelkit::label {

std::string JoinParts(const std::vector<std::string>& parts) {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0U) {
      joined += kSeparator;
    }
    joined += parts[i];
  }
  return joined;
}

Label::Label(std::string text) : text_(std::move(text)), parts_{text_} {}

Label::Label(std::vector<std::string> parts) : text_(JoinParts(parts)), parts_(std::move(parts)) {}

scope::LabelScope Label::AsScope(scope::LabelEnvironment& env) const {
  return scope::LabelScope::FromLabel(*this, env);
}

std::ostream& operator<<(std::ostream& out, const Label& label) { return out << label.text(); }

}  // namespace labelkit::label
