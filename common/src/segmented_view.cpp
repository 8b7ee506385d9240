#include "common/segmented_view.hpp"

#include <algorithm>
#include <iterator>

#include "common/errors.hpp"

namespace tus {

SegmentedView::SegmentedView(std::vector<Subject>& subjects) : subjects_(subjects) {
  segments_.reserve(subjects_.size());
  for (const auto& subject : subjects_) {
    segments_.push_back({total_, subject.size()});
    total_ += subject.size();
  }
}

Answer SegmentedView::get(std::size_t absolute_index) const {
  check_index(absolute_index);
  std::size_t seg = segment_of(absolute_index);
  return subjects_[seg].get(absolute_index - segments_[seg].start);
}

void SegmentedView::set(std::size_t absolute_index, Answer value) {
  check_index(absolute_index);
  std::size_t seg = segment_of(absolute_index);
  subjects_[seg].set(absolute_index - segments_[seg].start, value);
}

std::optional<Location> SegmentedView::locate(std::size_t absolute_index) const {
  if (absolute_index >= total_) return std::nullopt;
  std::size_t seg = segment_of(absolute_index);
  return Location{subjects_[seg].name(), absolute_index - segments_[seg].start};
}

bool SegmentedView::update_next(Answer answer) {
  if (cursor_ >= total_) {
    throw CursorExhausted("cannot update past the last of " + std::to_string(total_) +
                          " slots");
  }
  set(cursor_, answer);
  ++cursor_;
  return cursor_ == total_;
}

bool SegmentedView::erase_last() {
  if (cursor_ == 0) return false;
  --cursor_;
  set(cursor_, Answer::Missing);
  return true;
}

std::size_t SegmentedView::segment_of(std::size_t absolute_index) const {
  // Last segment whose start is <= absolute_index. Empty segments share their
  // start with the following one and are skipped by upper_bound.
  auto it = std::upper_bound(segments_.begin(), segments_.end(), absolute_index,
                             [](std::size_t value, const Segment& s) { return value < s.start; });
  return static_cast<std::size_t>(std::distance(segments_.begin(), it)) - 1;
}

void SegmentedView::check_index(std::size_t absolute_index) const {
  if (absolute_index >= total_) {
    throw IndexOutOfRange("absolute index " + std::to_string(absolute_index) +
                          " out of bounds [0, " + std::to_string(total_) + ")");
  }
}

}  // namespace tus
