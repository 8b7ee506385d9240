#include "recorder/session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace tus::recorder {

std::string to_string(SessionOutcome outcome) {
  switch (outcome) {
    case SessionOutcome::Completed:
      return "COMPLETED";
    case SessionOutcome::Aborted:
      return "ABORTED";
  }
  return "ABORTED";
}

Session::Session(Quiz& quiz, KeySource keys, std::ostream& out)
    : quiz_(quiz), keys_(std::move(keys)), out_(out) {}

SessionOutcome Session::run() {
  spdlog::info("session {}: started, {} slots", quiz_.created_at(), quiz_.size());
  out_ << help_banner() << '\n';
  display_.paint(quiz_, out_);

  while (true) {
    auto key = keys_();
    if (!key) {
      spdlog::warn("session {}: input closed", quiz_.created_at());
      return SessionOutcome::Aborted;
    }
    Command command = command_from_key(*key);
    if (command.kind == CommandKind::Abort) {
      spdlog::info("session {}: aborted by user", quiz_.created_at());
      return SessionOutcome::Aborted;
    }
    if (command.kind == CommandKind::Ignore) continue;

    bool done = apply(command);
    display_.paint(quiz_, out_);
    if (done) {
      spdlog::info("session {}: complete", quiz_.created_at());
      return SessionOutcome::Completed;
    }
  }
}

bool Session::apply(const Command& command) {
  switch (command.kind) {
    case CommandKind::Answer: {
      QuizState before = quiz_.state();
      bool done = quiz_.update(command.answer);
      if (before == QuizState::FillingTheoretical && quiz_.state() != before) {
        spdlog::info("session {}: {} filled, {} -> {}", quiz_.created_at(),
                     quiz_.theoretical().name(), to_string(before), to_string(quiz_.state()));
      }
      return done;
    }
    case CommandKind::Erase:
      if (!quiz_.erase()) {
        spdlog::debug("session {}: nothing to erase in {}", quiz_.created_at(),
                      quiz_.active().name());
      }
      return false;
    case CommandKind::Abort:
    case CommandKind::Ignore:
      return false;
  }
  return false;
}

}  // namespace tus::recorder
