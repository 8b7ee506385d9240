#pragma once

#include <nlohmann/json.hpp>

#include "common/category.hpp"
#include "common/quiz.hpp"
#include "common/subject.hpp"

namespace tus {

// Saved sheet layout:
// {
//   "created_at": "...",
//   "theoretical": {"name": ..., "subjects": {name: {"name": ..., "answers": ["D", ...]}}},
//   "clinical": {...}
// }
// Objects keep blueprint order.
nlohmann::ordered_json subject_to_json(const Subject& subject);
nlohmann::ordered_json category_to_json(const Category& category);
nlohmann::ordered_json quiz_to_json(const Quiz& quiz);

}  // namespace tus
