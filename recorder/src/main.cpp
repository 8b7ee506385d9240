#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/blueprint.hpp"
#include "common/quiz.hpp"
#include "recorder/config.hpp"
#include "recorder/record_store.hpp"
#include "recorder/session.hpp"
#include "recorder/terminal.hpp"

using tus::Quiz;
using tus::QuizBlueprint;
using tus::recorder::RecordStore;
using tus::recorder::Session;
using tus::recorder::SessionOutcome;

namespace {

void setup_logging(const std::filesystem::path& log_path) {
  // The terminal is owned by the progress display, so logs go to a file only.
  if (log_path.has_parent_path()) {
    std::filesystem::create_directories(log_path.parent_path());
  }
  auto logger = spdlog::rotating_logger_mt("recorder", log_path.string(), 1024 * 1024 * 5, 3);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

}  // namespace

int main(int argc, char** argv) {
  auto config = tus::recorder::config_from_args(argc, argv);

  try {
    setup_logging(config.log_path);

    QuizBlueprint blueprint = tus::default_blueprint();
    if (config.blueprint_path) {
      std::string error;
      auto loaded = tus::recorder::load_blueprint(*config.blueprint_path, error);
      if (!loaded) {
        spdlog::error("blueprint: {}", error);
        std::cerr << "[recorder] " << error << "\n";
        return 1;
      }
      blueprint = *loaded;
      spdlog::info("blueprint loaded from {}", config.blueprint_path->string());
    }

    Quiz quiz(blueprint);
    SessionOutcome outcome = SessionOutcome::Aborted;
    {
      tus::recorder::TerminalGuard terminal;
      if (!terminal.active()) {
        spdlog::warn("stdin is not a terminal, terminal mode left unchanged");
      }
      Session session(quiz, tus::recorder::read_key, std::cout);
      outcome = session.run();
    }
    spdlog::info("quiz {} session outcome {}", quiz.created_at(),
                 tus::recorder::to_string(outcome));

    if (outcome == SessionOutcome::Aborted) {
      std::cout << "Quiz aborted by user.\n";
      spdlog::info("quiz {} discarded", quiz.created_at());
      return 0;
    }

    std::cout << "Quiz entry successful.\n";
    RecordStore store(config.records_dir);
    std::string error;
    auto path = store.save(quiz, &error);
    if (!path) {
      std::cerr << "Error saving quiz record: " << error << "\n";
      return 1;
    }
    std::cout << "Quiz record saved to " << path->string() << "\n";
  } catch (const std::exception& ex) {
    spdlog::critical("recorder failed: {}", ex.what());
    std::cerr << "[recorder] " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
