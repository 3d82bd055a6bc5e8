// Copyright 2026 The boardkit Authors

#include "interaction/selection_manager.h"

#include <algorithm>

namespace boardkit {
namespace internal {

bool SelectionManager::AddOne(const std::string& id) {
  if (id.empty() || !set_.insert(id).second) return false;
  ordered_.push_back(id);
  return true;
}

bool SelectionManager::RemoveOne(const std::string& id) {
  if (set_.erase(id) == 0) return false;
  ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), id),
                 ordered_.end());
  return true;
}

void SelectionManager::Changed() {
  if (on_change_) on_change_();
}

void SelectionManager::Select(const std::string& id, bool multi) {
  if (multi) {
    if (!RemoveOne(id)) AddOne(id);
    Changed();
    return;
  }
  if (ordered_.size() == 1 && ordered_.front() == id) return;
  ordered_.clear();
  set_.clear();
  AddOne(id);
  Changed();
}

void SelectionManager::Apply(const std::vector<std::string>& ids, Mode mode) {
  bool changed = false;
  switch (mode) {
    case Mode::kReplace: {
      std::vector<std::string> before = ordered_;
      ordered_.clear();
      set_.clear();
      for (const std::string& id : ids) AddOne(id);
      changed = before != ordered_;
      break;
    }
    case Mode::kAdd:
      for (const std::string& id : ids) changed |= AddOne(id);
      break;
    case Mode::kRemove:
      for (const std::string& id : ids) changed |= RemoveOne(id);
      break;
    case Mode::kToggle:
      for (const std::string& id : ids) {
        if (!RemoveOne(id)) AddOne(id);
        changed = true;
      }
      break;
  }
  if (changed) Changed();
}

void SelectionManager::Clear() {
  if (ordered_.empty()) return;
  ordered_.clear();
  set_.clear();
  Changed();
}

void SelectionManager::Prune(const std::vector<std::string>& removed) {
  bool changed = false;
  for (const std::string& id : removed) changed |= RemoveOne(id);
  if (changed) Changed();
}

void SelectionManager::RetainIf(
    const std::function<bool(const std::string&)>& keep) {
  std::vector<std::string> drop;
  for (const std::string& id : ordered_) {
    if (!keep(id)) drop.push_back(id);
  }
  Prune(drop);
}

}  // namespace internal
}  // namespace boardkit
