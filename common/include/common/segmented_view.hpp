#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/answer.hpp"
#include "common/subject.hpp"

namespace tus {

// Position of an absolute index inside one subject.
struct Location {
  std::string subject;
  std::size_t index{};
};

// Presents an ordered list of subjects as one flat, absolutely indexed
// sequence with a fill cursor. The view does not own the subjects; writes
// through it land in the referenced vector, which must outlive the view and
// must not be resized.
class SegmentedView {
 public:
  explicit SegmentedView(std::vector<Subject>& subjects);

  SegmentedView(const SegmentedView&) = delete;
  SegmentedView& operator=(const SegmentedView&) = delete;

  std::size_t size() const { return total_; }
  // Next absolute index to be filled, in [0, size()].
  std::size_t cursor() const { return cursor_; }
  bool full() const { return cursor_ == total_; }

  // Throw IndexOutOfRange outside [0, size()).
  Answer get(std::size_t absolute_index) const;
  void set(std::size_t absolute_index, Answer value);

  std::optional<Location> locate(std::size_t absolute_index) const;

  // Writes at the cursor and advances it. Returns true when the view became
  // full with this call. Throws CursorExhausted when already full.
  bool update_next(Answer answer);
  // Steps the cursor back and resets that slot to Missing. Returns false (and
  // does nothing) at cursor 0.
  bool erase_last();

 private:
  struct Segment {
    std::size_t start{};
    std::size_t length{};
  };

  // Index into subjects_/segments_ holding absolute_index; caller checks range.
  std::size_t segment_of(std::size_t absolute_index) const;
  void check_index(std::size_t absolute_index) const;

  std::vector<Subject>& subjects_;
  std::vector<Segment> segments_;
  std::size_t total_{0};
  std::size_t cursor_{0};
};

}  // namespace tus
