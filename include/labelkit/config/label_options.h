/***
 * Name: labelkit::config::LabelOptions
 * Purpose: Behavior switches for one labeling environment.
 * Inputs: Populated by callers or by the CLI driver
 * Outputs: Consumed by segment validation and scope resolution
 * Theory of Operation: Plain value type; defaults reproduce the library's
 *   standard behavior.
 */
#pragma once

namespace labelkit {
namespace config {

struct LabelOptions {
  bool forbid_underscore = false;        // also reject '_' in segment names
  bool warn_on_global_fallback = true;   // warn when numbering falls back to "global"
};

}  // namespace config
}  // namespace labelkit
