#include "recorder/record_store.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/record.hpp"

namespace tus::recorder {

RecordStore::RecordStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path RecordStore::path_for(const std::string& created_at) const {
  return directory_ / ("quiz_" + created_at + ".json");
}

std::optional<std::filesystem::path> RecordStore::save(const Quiz& quiz, std::string* error) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    if (error) *error = "cannot create " + directory_.string() + ": " + ec.message();
    spdlog::error("record store: {}", ec.message());
    return std::nullopt;
  }

  auto path = path_for(quiz.created_at());
  if (std::filesystem::exists(path, ec)) {
    spdlog::warn("record store: replacing existing record {}", path.string());
  }

  // Written beside the target, then renamed over it. A failed write never
  // touches an existing record for the same day.
  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      if (error) *error = "cannot open " + tmp_path.string() + " for writing";
      spdlog::error("record store: cannot open {}", tmp_path.string());
      return std::nullopt;
    }
    out << quiz_to_json(quiz).dump(4) << '\n';
    out.flush();
    if (!out) {
      if (error) *error = "failed to write " + tmp_path.string();
      spdlog::error("record store: write failed for {}", tmp_path.string());
      out.close();
      std::filesystem::remove(tmp_path, ec);
      return std::nullopt;
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    if (error) *error = "cannot move " + tmp_path.string() + " to " + path.string() + ": " +
                        ec.message();
    spdlog::error("record store: rename to {} failed: {}", path.string(), ec.message());
    std::error_code cleanup;
    std::filesystem::remove(tmp_path, cleanup);
    return std::nullopt;
  }

  spdlog::info("record store: saved {}", path.string());
  return path;
}

}  // namespace tus::recorder
