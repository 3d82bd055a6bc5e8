// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_INTERACTION_SELECTION_MANAGER_H_
#define BOARDKIT_INTERACTION_SELECTION_MANAGER_H_

#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace boardkit {
namespace internal {

/// Ordered set of selected object ids. The primary selection is always the
/// most recently added member, and is empty exactly when the set is.
class SelectionManager {
 public:
  enum class Mode { kReplace, kAdd, kRemove, kToggle };

  SelectionManager() = default;

  // Non-copyable.
  SelectionManager(const SelectionManager&) = delete;
  SelectionManager& operator=(const SelectionManager&) = delete;

  /// Called after every effective change.
  void SetChangeCallback(std::function<void()> callback) {
    on_change_ = std::move(callback);
  }

  /// Click selection: multi toggles membership, otherwise replaces.
  void Select(const std::string& id, bool multi);

  void Apply(const std::vector<std::string>& ids, Mode mode);
  void Clear();

  /// Drop ids that no longer exist.
  void Prune(const std::vector<std::string>& removed);
  void RetainIf(const std::function<bool(const std::string&)>& keep);

  bool Contains(const std::string& id) const { return set_.count(id) > 0; }
  bool empty() const { return ordered_.empty(); }
  size_t size() const { return ordered_.size(); }
  bool IsSingle() const { return ordered_.size() == 1; }

  /// Selection order, oldest first.
  const std::vector<std::string>& ids() const { return ordered_; }

  /// Primary (last touched) id, or nullptr when empty.
  const std::string* primary() const {
    return ordered_.empty() ? nullptr : &ordered_.back();
  }

 private:
  bool AddOne(const std::string& id);
  bool RemoveOne(const std::string& id);
  void Changed();

  std::vector<std::string> ordered_;
  std::unordered_set<std::string> set_;
  std::function<void()> on_change_;
};

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_INTERACTION_SELECTION_MANAGER_H_
