#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/quiz.hpp"

namespace tus::recorder {

// Writes finished sheets as quiz_<created_at>.json under one directory.
class RecordStore {
 public:
  explicit RecordStore(std::filesystem::path directory);

  std::filesystem::path path_for(const std::string& created_at) const;

  // Creates the directory if needed and replaces any record with the same
  // created_at. Returns the written path.
  std::optional<std::filesystem::path> save(const Quiz& quiz, std::string* error = nullptr);

 private:
  std::filesystem::path directory_;
};

}  // namespace tus::recorder
