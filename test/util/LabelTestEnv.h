// Utility: isolate tests from process-wide labeling state
#pragma once

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "labelkit/metrics/metrics.h"
#include "labelkit/scope/label_environment.h"
#include "labelkit/support/log.h"

namespace testutil {

// Resets the default environment, metrics and logging around each test and
// captures log output in `log`.
class LabelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    labelkit::scope::LabelEnvironment::Default().Reset();
    labelkit::scope::LabelEnvironment::Default().set_options({});
    labelkit::metrics::Metrics::Reset();
    labelkit::metrics::Metrics::Enable(false);
    labelkit::support::SetLogLevel(labelkit::support::LogLevel::Warning);
    labelkit::support::SetLogStream(&log);
  }

  void TearDown() override {
    labelkit::support::SetLogStream(nullptr);
    labelkit::scope::LabelEnvironment::Default().Reset();
  }

  bool LogContains(const std::string& needle) const { return log.str().find(needle) != std::string::npos; }

  std::ostringstream log;
};

}  // namespace testutil
