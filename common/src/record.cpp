#include "common/record.hpp"

#include <string>

namespace tus {

nlohmann::ordered_json subject_to_json(const Subject& subject) {
  nlohmann::ordered_json answers = nlohmann::ordered_json::array();
  for (Answer a : subject.answers()) {
    answers.push_back(std::string(1, to_code(a)));
  }
  nlohmann::ordered_json j;
  j["name"] = subject.name();
  j["answers"] = answers;
  return j;
}

nlohmann::ordered_json category_to_json(const Category& category) {
  nlohmann::ordered_json subjects = nlohmann::ordered_json::object();
  for (const auto& s : category.subjects()) {
    subjects[s.name()] = subject_to_json(s);
  }
  nlohmann::ordered_json j;
  j["name"] = category.name();
  j["subjects"] = subjects;
  return j;
}

nlohmann::ordered_json quiz_to_json(const Quiz& quiz) {
  nlohmann::ordered_json j;
  j["created_at"] = quiz.created_at();
  j["theoretical"] = category_to_json(quiz.theoretical());
  j["clinical"] = category_to_json(quiz.clinical());
  return j;
}

}  // namespace tus
