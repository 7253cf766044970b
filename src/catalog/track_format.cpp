#include "catalog/track_format.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace runthrough {

namespace {

// Left-aligned, padded with spaces to at least width.
void writeColumn(std::ostringstream& oss, const std::string& text, int width) {
  oss << std::left << std::setw(width) << text;
}

std::string trackColumns(const Track& track) {
  std::ostringstream oss;
  writeColumn(oss, std::to_string(track.id), 4);
  oss << " ";
  writeColumn(oss, truncateUtf8(track.title, LISTING_TEXT_WIDTH), 20);
  oss << "   ";
  writeColumn(oss, truncateUtf8(track.album, LISTING_TEXT_WIDTH), 20);
  oss << "   ";
  writeColumn(oss, formatTimestamp(track.lastplay), 19);
  oss << "   ";
  writeColumn(oss, std::to_string(track.rating), 3);
  oss << " ";
  return oss.str();
}

}  // namespace

std::string formatTimestamp(int64_t timestamp) {
  if (timestamp == 0) {
    return "--";
  }

  std::time_t unix_time = static_cast<std::time_t>(timestamp - GNUPOD_EPOCH_OFFSET);
  std::tm tm_utc{};
  if (gmtime_r(&unix_time, &tm_utc) == nullptr) {
    return "--";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string truncateUtf8(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t cut = max_bytes;
  // Back up over continuation bytes (10xxxxxx)
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

std::string formatTrackLine(const Track& track) {
  return trackColumns(track) + std::to_string(track.playcount) + "\n";
}

std::string formatWeightedTrackLine(const Track& track) {
  std::ostringstream oss;
  oss << trackColumns(track);
  writeColumn(oss, std::to_string(track.playcount), 5);
  oss << "   ";
  writeColumn(oss, std::to_string(track.recency_rank), 5);
  oss << " " << track.weight << "\n";
  return oss.str();
}

std::string weightedListingHeader() {
  std::ostringstream oss;
  writeColumn(oss, "id", 4);
  oss << " ";
  writeColumn(oss, "title", 20);
  oss << "   ";
  writeColumn(oss, "album", 20);
  oss << "   ";
  writeColumn(oss, "last played", 19);
  oss << "   ";
  writeColumn(oss, "rt", 3);
  oss << " ";
  writeColumn(oss, "pc", 5);
  oss << "   ";
  writeColumn(oss, "rank", 5);
  oss << " weight\n";
  return oss.str();
}

}  // namespace runthrough
