#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tus {

constexpr std::size_t kQuestionsPerCategory = 100;

struct SubjectBlueprint {
  std::string name;
  std::size_t question_count{};
};

struct CategoryBlueprint {
  std::string name;
  std::size_t expected_questions{kQuestionsPerCategory};
  std::vector<SubjectBlueprint> subjects;
};

struct QuizBlueprint {
  CategoryBlueprint theoretical;
  CategoryBlueprint clinical;
};

// Reference exam layout: "Temel" and "Klinik", six subjects and 100 questions each.
QuizBlueprint default_blueprint();

// Structural validation only; the per-category sum is checked when a Category
// is built. On failure returns std::nullopt and fills error.
std::optional<QuizBlueprint> blueprint_from_json(const nlohmann::json& j, std::string& error);
nlohmann::json blueprint_to_json(const QuizBlueprint& blueprint);

}  // namespace tus
