/***
 * Name: labelkit::label::AutoLabel
 * Purpose: Produce a reproducible hierarchical label from the active scopes.
 * Inputs:
 *   - name: nothing, a segment string, or an existing Label
 *   - scope (optional overload): an explicit, already-resolved scope
 *   - env: labeling environment (default: process-wide)
 * Outputs: Label
 * Theory of Operation:
 *   1. A Label passed as `name` is returned unchanged, so AutoLabel is idempotent.
 *   2. With an explicit scope: label = scope.path + [name or scope.NextLabel()].
 *   3. Otherwise a transient scope with basename `name` is entered and exited
 *      around the call; the label is its resolved path. Inside an active scope
 *      "model", AutoLabel() yields "model/1", "model/2", ... and
 *      AutoLabel("foo") yields "model/foo". With no active scope and no name
 *      the numbering falls back to "global/N" with a warning. As a side effect
 *      the transient entry resets the counter named by the returned label.
 */
#pragma once

#include <string>
#include <variant>

#include "labelkit/label/label.h"
#include "labelkit/scope/label_environment.h"
#include "labelkit/scope/label_scope.h"

namespace labelkit {
namespace label {

using LabelName = std::variant<std::monostate, std::string, Label>;

Label AutoLabel(const LabelName& name = {}, scope::LabelEnvironment& env = scope::LabelEnvironment::Default());

Label AutoLabel(const LabelName& name, scope::LabelScope& scope);

}  // namespace label
}  // namespace labelkit
