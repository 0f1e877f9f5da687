#pragma once
/*
 * History
 *
 * Purpose: undo/redo stack over a generic action type. The executor that
 *          runs an action and reports its Change is injected, so History
 *          knows nothing about commands.
 * Layout: entries_[0, cursor_) are done; entries_[cursor_, size) have been
 *         undone and are kept for redo until the next recorded change.
 */
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include <glog/logging.h>
#include "change.hpp"
#include "edit_buffer.hpp"

template <typename Action>
class History {
public:
  using Executor = std::function<std::optional<Change>(const Action&)>;

  History(EditBuffer& subject, Executor executor)
      : subject_(subject), executor_(std::move(executor)) {}

  // Execute an action and record its change. Returns true if a change was
  // recorded, either as a new entry or merged into the last one.
  bool perform(const Action& action) {
    std::optional<Change> change = executor_(action);
    if (!change) {
      amalgamating_ = false;
      return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(cursor_), entries_.end());
    if (amalgamating_ && !entries_.empty() && entries_.back().amalgamate(*change)) {
      VLOG(1) << "history: amalgamated into entry " << entries_.size() - 1;
      return true;
    }
    entries_.push_back(std::move(*change));
    cursor_++;
    amalgamating_ = true;
    VLOG(1) << "history: recorded entry " << cursor_ - 1;
    return true;
  }

  // Returns false when there is nothing to undo. Undo and redo both end
  // the current amalgamation run.
  bool undo() {
    if (cursor_ == 0) return false;
    cursor_--;
    amalgamating_ = false;
    entries_[cursor_].undo(subject_);
    VLOG(1) << "history: undo entry " << cursor_;
    return true;
  }

  // Returns false when there is nothing to redo.
  bool redo() {
    if (cursor_ == entries_.size()) return false;
    amalgamating_ = false;
    entries_[cursor_].redo(subject_);
    VLOG(1) << "history: redo entry " << cursor_;
    cursor_++;
    return true;
  }

  // Forget everything, e.g. after loading a new file.
  void reset() {
    entries_.clear();
    cursor_ = 0;
  }

  size_t size() const { return entries_.size(); }
  size_t cursor() const { return cursor_; }
  bool amalgamating() const { return amalgamating_; }
  const Change& entry(size_t i) const { return entries_[i]; }

private:
  EditBuffer& subject_;
  Executor executor_;
  std::vector<Change> entries_;
  size_t cursor_ = 0;
  bool amalgamating_ = false;
};
