#pragma once

#include <cstddef>
#include <string>

#include "common/answer.hpp"
#include "common/blueprint.hpp"
#include "common/category.hpp"

namespace tus {

enum class QuizState { FillingTheoretical, FillingClinical, Complete };

std::string to_string(QuizState state);

// Local date as "%y_%m_%d", the default record identifier.
std::string make_created_at();

// One answer sheet: the theoretical category is filled first, then the
// clinical one. Once the theoretical view fills up, input goes to the clinical
// category for the rest of the quiz's life, erase included.
class Quiz {
 public:
  // Throws ConfigurationInvalid when either category is invalid or empty.
  explicit Quiz(const QuizBlueprint& blueprint, std::string created_at = make_created_at());

  Quiz(const Quiz&) = delete;
  Quiz& operator=(const Quiz&) = delete;

  // Records the next answer. Returns true only on the call that fills the
  // last clinical slot. Throws CursorExhausted if called after that.
  bool update(Answer answer);
  // Removes the last answer of the active category. Returns false when that
  // category has nothing to erase.
  bool erase();

  QuizState state() const;
  bool complete() const { return clinical_.view().full(); }

  // Read-only: answers only enter through update() and erase().
  const Category& active() const { return clinical_active_ ? clinical_ : theoretical_; }

  const Category& theoretical() const { return theoretical_; }
  const Category& clinical() const { return clinical_; }
  const std::string& created_at() const { return created_at_; }

  // Total slots across both categories.
  std::size_t size() const { return theoretical_.view().size() + clinical_.view().size(); }
  std::size_t subject_count() const {
    return theoretical_.subjects().size() + clinical_.subjects().size();
  }

 private:
  Category& active_category() { return clinical_active_ ? clinical_ : theoretical_; }

  Category theoretical_;
  Category clinical_;
  bool clinical_active_{false};
  std::string created_at_;
};

}  // namespace tus
