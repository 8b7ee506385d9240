#pragma once

#include <ostream>
#include <string>

#include "common/quiz.hpp"
#include "recorder/display.hpp"
#include "recorder/input.hpp"

namespace tus::recorder {

enum class SessionOutcome { Completed, Aborted };

std::string to_string(SessionOutcome outcome);

// Feeds keys into a quiz until it is complete or the user aborts, repainting
// the progress block after every change.
class Session {
 public:
  Session(Quiz& quiz, KeySource keys, std::ostream& out);

  SessionOutcome run();

  // Applies one command; returns true when the quiz just completed.
  bool apply(const Command& command);

 private:
  Quiz& quiz_;
  KeySource keys_;
  std::ostream& out_;
  Display display_;
};

}  // namespace tus::recorder
