#include "common/category.hpp"

#include <set>

#include "common/errors.hpp"

namespace tus {

namespace {

std::vector<Subject> make_subjects(const CategoryBlueprint& blueprint) {
  std::set<std::string> seen;
  std::vector<Subject> subjects;
  subjects.reserve(blueprint.subjects.size());
  for (const auto& s : blueprint.subjects) {
    if (!seen.insert(s.name).second) {
      throw ConfigurationInvalid("duplicate subject " + s.name + " in " + blueprint.name);
    }
    subjects.emplace_back(s.name, s.question_count);
  }
  return subjects;
}

}  // namespace

Category::Category(const CategoryBlueprint& blueprint)
    : name_(blueprint.name), subjects_(make_subjects(blueprint)), view_(subjects_) {
  if (view_.size() != blueprint.expected_questions) {
    throw ConfigurationInvalid(std::to_string(view_.size()) + " questions in " + name_ +
                               " instead of " +
                               std::to_string(blueprint.expected_questions));
  }
}

const Subject* Category::find(const std::string& subject_name) const {
  for (const auto& s : subjects_) {
    if (s.name() == subject_name) return &s;
  }
  return nullptr;
}

int Category::num_correct() const {
  int total = 0;
  for (const auto& s : subjects_) total += s.num_correct();
  return total;
}

int Category::num_wrong() const {
  int total = 0;
  for (const auto& s : subjects_) total += s.num_wrong();
  return total;
}

int Category::num_empty() const {
  int total = 0;
  for (const auto& s : subjects_) total += s.num_empty();
  return total;
}

double Category::num_net() const {
  double total = 0.0;
  for (const auto& s : subjects_) total += s.num_net();
  return total;
}

}  // namespace tus
