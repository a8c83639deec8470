#pragma once
#include <set>
#include <cstddef>

// Indices of spawned, unresolved notes. Track indices already follow
// (time, lane, source order), so ordering by index is ordering by time.
class ActiveNoteSet {
public:
  using const_iterator = std::set<size_t>::const_iterator;

  void insert(size_t idx);
  // Throws std::logic_error if idx is not a member: a note leaves exactly once.
  void erase(size_t idx);
  bool contains(size_t idx) const { return set_.count(idx) != 0; }
  size_t size() const { return set_.size(); }
  bool empty() const { return set_.empty(); }
  void clear() { set_.clear(); }

  const_iterator begin() const { return set_.begin(); }
  const_iterator end() const { return set_.end(); }

private:
  std::set<size_t> set_;
};
