/***
 * Name: labelkit::scope::LabelScope
 * Purpose: One node of the hierarchical label namespace ("directory" of labels).
 * Inputs: A basename, nothing (derive the basename), a Label, or another scope
 * Outputs: Resolved path; per-scope counter values via NextLabel()
 * Theory of Operation:
 *   States: UNRESOLVED -> (Enter) -> RESOLVED+ACTIVE -> (Exit) -> RESOLVED+INACTIVE.
 *   Scopes built from a Label, another scope, or Global() start RESOLVED+INACTIVE.
 *
 *   Entering an unresolved scope fixes its path to parent.path + [basename],
 *   where parent is the innermost active scope of the environment. A missing
 *   basename is drawn from the parent's counter; with no parent either, it is
 *   drawn from the "global" scope and a warning is logged, since that numbering
 *   depends on everything else labeled globally before it.
 *
 *   Every Enter pushes this scope onto the environment's context stack under
 *   kLabelScopeContextKey and resets the counter named by the full path. So
 *   re-entering the same scope object (for example once per loop iteration)
 *   restarts its numbering at 1 each time; that reuse is intended.
 *
 *   Use LabelScope::Guard to enter for the duration of a block:
 *     auto model = LabelScope::FromBasename("model");
 *     LabelScope::Guard entered(model);
 *     AutoLabel();  // "model/1"
 *
 *   The stack holds scopes by address, so LabelScope is neither copyable nor
 *   movable. Named constructors rely on guaranteed copy elision.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "labelkit/scope/label_environment.h"

namespace labelkit {

namespace label {
class Label;
}  // namespace label

namespace scope {

class LabelScope {
 public:
  /***
   * Name: labelkit::scope::LabelScope::Guard
   * Purpose: Keep a scope entered for the lifetime of a block.
   * Theory of Operation: Enters in the constructor and exits in the destructor,
   *   on every path out of the block including exceptions (lock_guard style).
   */
  class Guard {
   public:
    explicit Guard(LabelScope& scope) : scope_(scope) { scope_.Enter(); }
    ~Guard() noexcept { scope_.Release(); }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    LabelScope& scope() const { return scope_; }

   private:
    LabelScope& scope_;
  };

  static LabelScope FromBasename(std::string basename, LabelEnvironment& env = LabelEnvironment::Default());
  static LabelScope Unnamed(LabelEnvironment& env = LabelEnvironment::Default());
  static LabelScope FromLabel(const label::Label& label, LabelEnvironment& env = LabelEnvironment::Default());
  /***
   * FromExistingScope: New inactive scope with the same path and environment.
   * Throws UnresolvedScopeError when `other` has not been entered yet.
   */
  static LabelScope FromExistingScope(const LabelScope& other);
  /*** Global: Fresh pre-resolved scope with path ["global"]. Usable without entering. */
  static LabelScope Global(LabelEnvironment& env = LabelEnvironment::Default());

  /*** Current: Innermost active scope of `env`, or nullptr when none is active. */
  static LabelScope* Current(LabelEnvironment& env = LabelEnvironment::Default());

  LabelScope(const LabelScope&) = delete;
  LabelScope& operator=(const LabelScope&) = delete;
  /*** Destroying a scope that is still active removes its stack entries and logs an error. */
  ~LabelScope();

  /***
   * Enter: Resolve if needed, activate, and reset this scope's counter.
   * Prefer Guard, which pairs the Exit automatically.
   */
  void Enter();

  /***
   * Exit: Deactivate. Throws ScopeOrderError when another scope is on top and
   * NoContextError when nothing is active; the stack is left unchanged then.
   * Exiting out of push order is a programming error.
   */
  void Exit();

  /*** NextLabel: Next value of this scope's counter, as text. Requires a resolved path. */
  std::string NextLabel();
  std::uint64_t NextValue();

  /*** Name: Full path joined by '/', e.g. "model/cell/2". Throws UnresolvedScopeError. */
  std::string Name() const;
  std::string AbsoluteScope() const { return Name(); }

  /*** CheckEntered: Throw UnresolvedScopeError unless the path is resolved. */
  void CheckEntered() const;

  const std::optional<std::string>& basename() const { return basename_; }
  const std::optional<std::vector<std::string>>& path() const { return path_; }
  bool resolved() const { return path_.has_value(); }
  bool activated() const { return entries_ != 0; }
  LabelEnvironment& environment() const { return *env_; }

  std::string Repr() const;

  /*** Scopes are equal when both paths are resolved and equal element-wise. */
  friend bool operator==(const LabelScope& lhs, const LabelScope& rhs) {
    return lhs.path_.has_value() && rhs.path_.has_value() && *lhs.path_ == *rhs.path_;
  }

 private:
  LabelScope(LabelEnvironment& env, std::optional<std::string> basename,
             std::optional<std::vector<std::string>> path);

  void Resolve();
  void Release() noexcept;

  LabelEnvironment* env_;
  std::optional<std::string> basename_;
  std::optional<std::vector<std::string>> path_;
  // Number of label-scope stack entries referring to this object.
  std::size_t entries_{0};
};

std::ostream& operator<<(std::ostream& out, const LabelScope& scope);

}  // namespace scope
}  // namespace labelkit
