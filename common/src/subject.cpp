#include "common/subject.hpp"

#include <algorithm>
#include <utility>

#include "common/errors.hpp"

namespace tus {

namespace {

int count_of(const std::vector<Answer>& answers, Answer value) {
  return static_cast<int>(std::count(answers.begin(), answers.end(), value));
}

}  // namespace

Subject::Subject(std::string name, std::size_t question_count)
    : name_(std::move(name)), answers_(question_count, Answer::Missing) {}

Answer Subject::get(std::size_t index) const {
  check_index(index);
  return answers_[index];
}

void Subject::set(std::size_t index, Answer value) {
  check_index(index);
  answers_[index] = value;
}

int Subject::num_correct() const {
  return count_of(answers_, Answer::Correct);
}

int Subject::num_wrong() const {
  return count_of(answers_, Answer::Wrong);
}

int Subject::num_empty() const {
  return count_of(answers_, Answer::Empty);
}

double Subject::num_net() const {
  return static_cast<double>(num_correct()) - static_cast<double>(num_wrong()) / 4.0;
}

void Subject::check_index(std::size_t index) const {
  if (index >= answers_.size()) {
    throw IndexOutOfRange("index " + std::to_string(index) + " out of bounds [0, " +
                          std::to_string(answers_.size()) + ") in " + name_);
  }
}

}  // namespace tus
