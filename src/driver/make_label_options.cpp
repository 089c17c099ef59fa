/***
 * Name: labelkit::driver::MakeLabelOptions
 * Purpose: Translate CLI switches into LabelOptions.
 * Inputs: opts
 * Outputs: LabelOptions for a script environment
 */
#include "labelkit/driver/app.h"

namespace labelkit::driver {

config::LabelOptions MakeLabelOptions(const CliOptions& opts) {
  config::LabelOptions options;
  options.forbid_underscore = opts.strict_names;
  options.warn_on_global_fallback = opts.fallback_warning;
  return options;
}

}  // namespace labelkit::driver
