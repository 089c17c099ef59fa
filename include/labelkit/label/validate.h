/***
 * Name: labelkit::label (validate)
 * Purpose: Check a single label or scope segment supplied by calling code.
 * Inputs: Candidate segment and environment options
 * Outputs: Throws ValidationError on failure
 * Theory of Operation: Segments are path components: non-empty and free of the
 *   separator. With forbid_underscore, '_' is rejected as well.
 */
#pragma once

#include <string_view>

#include "labelkit/config/label_options.h"

namespace labelkit {
namespace label {

inline constexpr char kSeparator = '/';

void ValidateLabelName(std::string_view name, const config::LabelOptions& options = {});

}  // namespace label
}  // namespace labelkit
