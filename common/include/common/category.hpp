#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/blueprint.hpp"
#include "common/segmented_view.hpp"
#include "common/subject.hpp"

namespace tus {

// One top-level grouping of subjects with a single sequential view over them.
// Subjects are allocated fresh from the blueprint, so instances never share
// answer storage. Not copyable or movable because the view refers to the
// owned subject storage.
class Category {
 public:
  // Throws ConfigurationInvalid when subject names repeat or the subject sizes
  // do not add up to blueprint.expected_questions.
  explicit Category(const CategoryBlueprint& blueprint);

  Category(const Category&) = delete;
  Category& operator=(const Category&) = delete;

  const std::string& name() const { return name_; }

  // Subjects in blueprint order.
  const std::vector<Subject>& subjects() const { return subjects_; }
  // nullptr when no subject has that name.
  const Subject* find(const std::string& subject_name) const;

  SegmentedView& view() { return view_; }
  const SegmentedView& view() const { return view_; }

  int num_correct() const;
  int num_wrong() const;
  int num_empty() const;
  double num_net() const;

 private:
  std::string name_;
  std::vector<Subject> subjects_;
  SegmentedView view_;
};

}  // namespace tus
