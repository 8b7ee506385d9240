#include "common/quiz.hpp"

#include <chrono>
#include <ctime>
#include <utility>

#include "common/errors.hpp"

namespace tus {

std::string to_string(QuizState state) {
  switch (state) {
    case QuizState::FillingTheoretical:
      return "FILLING_THEORETICAL";
    case QuizState::FillingClinical:
      return "FILLING_CLINICAL";
    case QuizState::Complete:
      return "COMPLETE";
  }
  return "FILLING_THEORETICAL";
}

std::string make_created_at() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[16];
  std::size_t n = std::strftime(buf, sizeof(buf), "%y_%m_%d", &local);
  return std::string(buf, n);
}

Quiz::Quiz(const QuizBlueprint& blueprint, std::string created_at)
    : theoretical_(blueprint.theoretical),
      clinical_(blueprint.clinical),
      created_at_(std::move(created_at)) {
  if (theoretical_.view().size() == 0 || clinical_.view().size() == 0) {
    throw ConfigurationInvalid("quiz categories must not be empty");
  }
}

bool Quiz::update(Answer answer) {
  if (!active_category().view().update_next(answer)) return false;
  if (!clinical_active_) {
    clinical_active_ = true;
    return false;
  }
  return true;
}

bool Quiz::erase() {
  return active_category().view().erase_last();
}

QuizState Quiz::state() const {
  if (complete()) return QuizState::Complete;
  return clinical_active_ ? QuizState::FillingClinical : QuizState::FillingTheoretical;
}

}  // namespace tus
