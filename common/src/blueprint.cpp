#include "common/blueprint.hpp"

namespace tus {

namespace {

std::optional<CategoryBlueprint> category_blueprint_from_json(const nlohmann::json& j,
                                                              const std::string& key,
                                                              std::string& error) {
  if (!j.contains(key) || !j[key].is_object()) {
    error = key + " missing or not object";
    return std::nullopt;
  }
  const auto& c = j[key];

  CategoryBlueprint category;
  if (!c.contains("name") || !c["name"].is_string() || c["name"].get<std::string>().empty()) {
    error = key + ".name missing or empty";
    return std::nullopt;
  }
  category.name = c["name"].get<std::string>();

  if (c.contains("expected_questions")) {
    if (!c["expected_questions"].is_number_unsigned()) {
      error = key + ".expected_questions must be unsigned number";
      return std::nullopt;
    }
    category.expected_questions = c["expected_questions"].get<std::size_t>();
  }

  if (!c.contains("subjects") || !c["subjects"].is_array() || c["subjects"].empty()) {
    error = key + ".subjects missing or empty";
    return std::nullopt;
  }
  for (const auto& s : c["subjects"]) {
    if (!s.is_object() || !s.contains("name") || !s["name"].is_string()) {
      error = key + ": subject name missing or not string";
      return std::nullopt;
    }
    if (!s.contains("question_count") || !s["question_count"].is_number_unsigned()) {
      error = key + ": question_count missing or not unsigned number for " +
              s["name"].get<std::string>();
      return std::nullopt;
    }
    category.subjects.push_back(
        {s["name"].get<std::string>(), s["question_count"].get<std::size_t>()});
  }
  return category;
}

nlohmann::json category_blueprint_to_json(const CategoryBlueprint& category) {
  nlohmann::json subjects = nlohmann::json::array();
  for (const auto& s : category.subjects) {
    subjects.push_back({{"name", s.name}, {"question_count", s.question_count}});
  }
  return {{"name", category.name},
          {"expected_questions", category.expected_questions},
          {"subjects", subjects}};
}

}  // namespace

QuizBlueprint default_blueprint() {
  QuizBlueprint bp;
  bp.theoretical = {"Temel",
                    kQuestionsPerCategory,
                    {{"Anatomi", 13},
                     {"Fizyoloji", 15},
                     {"Biyokimya", 18},
                     {"Mikrobiyoloji", 18},
                     {"Patoloji", 18},
                     {"Farmakoloji", 18}}};
  bp.clinical = {"Klinik",
                 kQuestionsPerCategory,
                 {{"Dahiliye", 25},
                  {"Dahili KS", 10},
                  {"Pediatri", 25},
                  {"Genel Cerrahi", 21},
                  {"Cerrahi KS", 9},
                  {"Kadın Doğum", 10}}};
  return bp;
}

std::optional<QuizBlueprint> blueprint_from_json(const nlohmann::json& j, std::string& error) {
  if (!j.is_object()) {
    error = "blueprint must be a JSON object";
    return std::nullopt;
  }
  auto theoretical = category_blueprint_from_json(j, "theoretical", error);
  if (!theoretical) return std::nullopt;
  auto clinical = category_blueprint_from_json(j, "clinical", error);
  if (!clinical) return std::nullopt;
  return QuizBlueprint{*theoretical, *clinical};
}

nlohmann::json blueprint_to_json(const QuizBlueprint& blueprint) {
  return {{"theoretical", category_blueprint_to_json(blueprint.theoretical)},
          {"clinical", category_blueprint_to_json(blueprint.clinical)}};
}

}  // namespace tus
