#include "recorder/config.hpp"

#include <exception>
#include <fstream>

#include <nlohmann/json.hpp>

namespace tus::recorder {

RecorderConfig config_from_args(int argc, char** argv) {
  RecorderConfig config;
  if (argc > 1) {
    config.records_dir = argv[1];
  }
  if (argc > 2) {
    config.blueprint_path = std::filesystem::path(argv[2]);
  }
  return config;
}

std::optional<QuizBlueprint> load_blueprint(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open blueprint file " + path.string();
    return std::nullopt;
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const std::exception& ex) {
    error = std::string("JSON parse error in ") + path.string() + ": " + ex.what();
    return std::nullopt;
  }
  return blueprint_from_json(j, error);
}

}  // namespace tus::recorder
