#include "core/run_config.h"

#include <filesystem>
#include <system_error>

namespace runthrough {

namespace {

bool samePath(const std::string& a, const std::string& b) {
  if (a == b) return true;
  std::error_code ec;
  bool equivalent = std::filesystem::equivalent(a, b, ec);
  return !ec && equivalent;
}

}  // namespace

RunConfigError validateRunConfig(const RunConfig& config) {
  if (config.database_path.empty()) {
    return RunConfigError::EmptyDatabasePath;
  }

  if (config.playlist_name.empty()) {
    return RunConfigError::EmptyPlaylistName;
  }

  // Listing never writes, so the output path is irrelevant there
  if (!config.list_tracks && !config.output_path.empty() &&
      samePath(config.output_path, config.database_path)) {
    return RunConfigError::OutputIsInput;
  }

  return RunConfigError::OK;
}

const char* runConfigErrorString(RunConfigError error) {
  switch (error) {
    case RunConfigError::OK: return "OK";
    case RunConfigError::EmptyDatabasePath: return "Database path is empty";
    case RunConfigError::EmptyPlaylistName: return "Playlist name is empty";
    case RunConfigError::OutputIsInput:
      return "Output path is the database being read; choose another output file";
  }
  return "Unknown config error";
}

}  // namespace runthrough
