#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/blueprint.hpp"

namespace tus::recorder {

struct RecorderConfig {
  std::filesystem::path records_dir{"quiz_records"};
  std::optional<std::filesystem::path> blueprint_path;
  std::filesystem::path log_path{"logs/recorder.log"};
};

// tus_recorder [records_dir] [blueprint.json]
RecorderConfig config_from_args(int argc, char** argv);

// Reads and validates a blueprint file. On failure returns std::nullopt and fills error.
std::optional<QuizBlueprint> load_blueprint(const std::filesystem::path& path, std::string& error);

}  // namespace tus::recorder
