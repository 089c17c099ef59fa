/***
 * Name: labelkit::label::Label
 * Purpose: Immutable hierarchical identifier: a canonical string plus its path parts.
 * Inputs: A single segment string, or an ordered list of segments
 * Outputs: Value comparable and hashable exactly like its string form
 * Theory of Operation:
 *   text() == join(parts(), '/') always holds for labels built from parts; a
 *   label built from one string keeps that string verbatim as its single part.
 *   Equality, ordering and std::hash follow text(), so a Label equals the
 *   equivalent plain string. Being a distinct type is what lets AutoLabel
 *   recognize its own output and return it unchanged.
 */
#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "labelkit/scope/label_environment.h"

namespace labelkit {

namespace scope {
class LabelScope;
}  // namespace scope

namespace label {

class Label {
 public:
  explicit Label(std::string text);
  explicit Label(std::vector<std::string> parts);

  const std::string& text() const { return text_; }
  const std::vector<std::string>& parts() const { return parts_; }

  operator std::string_view() const noexcept { return text_; }  // NOLINT(google-explicit-constructor)

  /*** AsScope: A pre-resolved scope whose path equals parts(). */
  scope::LabelScope AsScope(scope::LabelEnvironment& env = scope::LabelEnvironment::Default()) const;

  friend bool operator==(const Label& lhs, const Label& rhs) { return lhs.text_ == rhs.text_; }
  friend bool operator==(const Label& lhs, std::string_view rhs) { return lhs.text_ == rhs; }
  friend std::strong_ordering operator<=>(const Label& lhs, const Label& rhs) { return lhs.text_ <=> rhs.text_; }
  friend std::strong_ordering operator<=>(const Label& lhs, std::string_view rhs) {
    return std::string_view(lhs.text_) <=> rhs;
  }

 private:
  std::string text_;
  std::vector<std::string> parts_;
};

std::ostream& operator<<(std::ostream& out, const Label& label);

/*** JoinParts: Segments joined by the separator. */
std::string JoinParts(const std::vector<std::string>& parts);

}  // namespace label
}  // namespace labelkit

template <>
struct std::hash<labelkit::label::Label> {
  std::size_t operator()(const labelkit::label::Label& label) const noexcept {
    return std::hash<std::string>{}(label.text());
  }
};
