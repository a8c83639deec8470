#include "active_notes.hpp"
#include <stdexcept>
#include <string>

void ActiveNoteSet::insert(size_t idx) {
  if (!set_.insert(idx).second)
    throw std::logic_error("note " + std::to_string(idx) + " is already active");
}

void ActiveNoteSet::erase(size_t idx) {
  if (set_.erase(idx) == 0)
    throw std::logic_error("note " + std::to_string(idx) + " is not active");
}
