/***
 * Name: test_label
 * Purpose: Validate Label text/parts invariants, string semantics and scope conversion.
 */
#include <gtest/gtest.h>

#include <functional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "labelkit/label/label.h"
#include "labelkit/scope/label_scope.h"
#include "util/LabelTestEnv.h"

using labelkit::label::Label;
using labelkit::scope::LabelScope;

using LabelTest = testutil::LabelTest;

TEST(Label, SingleStringIsVerbatim) {
  const Label label("bar");
  EXPECT_EQ("bar", label.text());
  ASSERT_EQ(1U, label.parts().size());
  EXPECT_EQ("bar", label.parts()[0]);
}

TEST(Label, PartsAreJoinedWithSlash) {
  const Label label(std::vector<std::string>{"model", "cell", "2"});
  EXPECT_EQ("model/cell/2", label.text());
  EXPECT_EQ(3U, label.parts().size());
}

TEST(Label, ComparesLikeItsString) {
  const Label label(std::vector<std::string>{"a", "b"});
  EXPECT_TRUE(label == "a/b");
  EXPECT_TRUE("a/b" == label);
  EXPECT_TRUE(label == std::string_view("a/b"));
  EXPECT_TRUE(label == Label("a/b"));
  EXPECT_FALSE(label == "a");
  EXPECT_TRUE(Label("a") < Label("b"));
  EXPECT_TRUE(label < std::string_view("b"));
}

TEST(Label, HashMatchesString) {
  const Label label(std::vector<std::string>{"x", "y"});
  EXPECT_EQ(std::hash<std::string>{}("x/y"), std::hash<Label>{}(label));
  std::unordered_set<Label> seen{label};
  EXPECT_EQ(1U, seen.count(Label("x/y")));
  std::set<Label> ordered{Label("b"), Label("a")};
  EXPECT_EQ("a", ordered.begin()->text());
}

TEST(Label, StreamsText) {
  std::ostringstream out;
  out << Label(std::vector<std::string>{"m", "1"});
  EXPECT_EQ("m/1", out.str());
}

TEST(Label, ConvertsToStringView) {
  const Label label("abc");
  const std::string_view view = label;
  EXPECT_EQ("abc", view);
}

TEST_F(LabelTest, AsScopeIsPreResolvedWithSameParts) {
  const Label label(std::vector<std::string>{"model", "3"});
  auto scope = label.AsScope();
  EXPECT_TRUE(scope.resolved());
  EXPECT_FALSE(scope.activated());
  EXPECT_EQ(label.parts(), *scope.path());
  EXPECT_EQ("model/3", scope.Name());
}
