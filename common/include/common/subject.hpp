#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/answer.hpp"

namespace tus {

// Named, fixed-length block of answer slots. Every slot starts as Missing.
class Subject {
 public:
  Subject(std::string name, std::size_t question_count);

  const std::string& name() const { return name_; }
  std::size_t size() const { return answers_.size(); }
  const std::vector<Answer>& answers() const { return answers_; }

  // Both throw IndexOutOfRange for index >= size().
  Answer get(std::size_t index) const;
  void set(std::size_t index, Answer value);

  int num_correct() const;
  int num_wrong() const;
  int num_empty() const;
  // correct - wrong / 4
  double num_net() const;

 private:
  void check_index(std::size_t index) const;

  std::string name_;
  std::vector<Answer> answers_;
};

}  // namespace tus
