/***
 * Name: test_metrics
 * Purpose: Validate labeling counters and their text/JSON rendering.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "labelkit/driver/app.h"
#include "labelkit/driver/cli.h"
#include "labelkit/label/auto_label.h"
#include "labelkit/metrics/metrics.h"
#include "labelkit/scope/label_scope.h"
#include "util/LabelTestEnv.h"

using labelkit::driver::CliOptions;
using labelkit::driver::ReportMetricsIfRequested;
using labelkit::metrics::Metrics;
using labelkit::scope::LabelScope;

using MetricsTest = testutil::LabelTest;

TEST_F(MetricsTest, DisabledRegistryIgnoresIncrements) {
  Metrics::Increment(Metrics::Counter::ScopesEntered);
  EXPECT_EQ(0U, Metrics::GetRegistry().Get(Metrics::Counter::ScopesEntered));
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(MetricsTest, CountsScopesAndFallbacks) {
  Metrics::Enable(true);
  {
    auto model = LabelScope::FromBasename("model");
    const LabelScope::Guard entered(model);
    labelkit::label::AutoLabel();
  }
  labelkit::label::AutoLabel();
  const auto& reg = Metrics::GetRegistry();
  // model + two transient scopes
  EXPECT_EQ(3U, reg.Get(Metrics::Counter::ScopesEntered));
  EXPECT_EQ(3U, reg.Get(Metrics::Counter::ScopesExited));
  EXPECT_EQ(2U, reg.Get(Metrics::Counter::LabelsGenerated));
  EXPECT_EQ(1U, reg.Get(Metrics::Counter::GlobalFallbacks));
  Metrics::Enable(false);
}

TEST_F(MetricsTest, TextAndJsonIncludeCounters) {
  Metrics::Enable(true);
  Metrics::Increment(Metrics::Counter::LabelsGenerated);
  std::ostringstream text;
  Metrics::PrintMetrics(Metrics::GetRegistry(), text);
  EXPECT_NE(text.str().find("== Metrics =="), std::string::npos);
  EXPECT_NE(text.str().find("labels_generated: 1"), std::string::npos);
  std::ostringstream json;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), json);
  EXPECT_NE(json.str().find("\"counters\""), std::string::npos);
  EXPECT_NE(json.str().find("\"labels_generated\": 1"), std::string::npos);
  EXPECT_NE(json.str().find("\"global_fallbacks\": 0"), std::string::npos);
  Metrics::Enable(false);
}

TEST_F(MetricsTest, ReportSilentWithoutMetricsFlag) {
  Metrics::Enable(true);
  labelkit::label::AutoLabel("x");
  CliOptions opts;
  std::ostringstream out;
  ReportMetricsIfRequested(opts, out);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(MetricsTest, ReportUsesRequestedFormat) {
  Metrics::Enable(true);
  labelkit::label::AutoLabel("x");
  CliOptions opts;
  opts.metrics = true;
  std::ostringstream text;
  ReportMetricsIfRequested(opts, text);
  EXPECT_NE(std::string::npos, text.str().find("labels_generated: 1"));

  opts.metrics_format = CliOptions::MetricsFormat::Json;
  std::ostringstream json;
  ReportMetricsIfRequested(opts, json);
  EXPECT_NE(std::string::npos, json.str().find("\"labels_generated\": 1"));
}
