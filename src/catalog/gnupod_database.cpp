/**
 * @file gnupod_database.cpp
 * @brief Implementation of the GNUpod database document.
 */

#include "catalog/gnupod_database.h"

#include <boost/property_tree/xml_parser.hpp>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <utility>

namespace runthrough {

namespace {

using boost::property_tree::ptree;

const char* const kAttrPrefix = "<xmlattr>.";

std::string attribute(const ptree& node, const char* name) {
  return node.get<std::string>(std::string(kAttrPrefix) + name, "");
}

// Missing or empty values read as 0; anything else must be a whole number.
bool parseNumber(const std::string& text, int64_t& value) {
  if (text.empty()) {
    value = 0;
    return true;
  }
  errno = 0;
  char* end = nullptr;
  long long parsed = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  value = static_cast<int64_t>(parsed);
  return true;
}

bool isElement(const ptree::value_type& child) {
  return !child.first.empty() && child.first[0] != '<';
}

}  // namespace

bool GnupodDatabase::read(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    doc_ = ptree{};
    tracks_.clear();
    error_ = "Failed to open file: " + path;
    return false;
  }
  return read(file);
}

bool GnupodDatabase::read(std::istream& is) {
  doc_ = ptree{};
  tracks_.clear();
  error_.clear();

  try {
    boost::property_tree::read_xml(is, doc_, boost::property_tree::xml_parser::trim_whitespace);
  } catch (const boost::property_tree::xml_parser_error& e) {
    error_ = std::string("Malformed XML: ") + e.what();
    return false;
  }

  return loadTracks();
}

bool GnupodDatabase::loadTracks() {
  const ptree* root = rootElement();
  if (root == nullptr) {
    error_ = "Document has no root element";
    return false;
  }

  auto files = root->get_child_optional("files");
  if (!files) {
    return true;  // No files section: empty catalog
  }

  std::set<TrackId> seen_ids;
  for (const auto& child : *files) {
    if (child.first != "file") continue;
    const ptree& node = child.second;

    Track track;
    int64_t id = 0;
    int64_t rating = 0;
    struct NumericField {
      const char* name;
      int64_t* target;
    };
    const NumericField fields[] = {
        {"id", &id},
        {"rating", &rating},
        {"playcount", &track.playcount},
        {"lastplay", &track.lastplay},
    };
    for (const auto& field : fields) {
      std::string text = attribute(node, field.name);
      if (!parseNumber(text, *field.target)) {
        error_ = "Invalid " + std::string(field.name) + " attribute '" + text + "' on file " +
                 std::to_string(tracks_.size() + 1);
        tracks_.clear();
        return false;
      }
    }

    if (rating < std::numeric_limits<int32_t>::min() ||
        rating > std::numeric_limits<int32_t>::max()) {
      error_ = "Invalid rating attribute '" + std::to_string(rating) + "' on file id " +
               std::to_string(id);
      tracks_.clear();
      return false;
    }
    if (track.playcount < 0) {
      error_ = "Negative playcount on file id " + std::to_string(id);
      tracks_.clear();
      return false;
    }
    if (!seen_ids.insert(id).second) {
      error_ = "Duplicate file id " + std::to_string(id);
      tracks_.clear();
      return false;
    }

    track.id = id;
    track.rating = static_cast<int32_t>(rating);
    track.title = attribute(node, "title");
    track.album = attribute(node, "album");
    tracks_.push_back(std::move(track));
  }

  return true;
}

ptree* GnupodDatabase::rootElement() {
  for (auto& child : doc_) {
    if (isElement(child)) return &child.second;
  }
  return nullptr;
}

const ptree* GnupodDatabase::rootElement() const {
  for (const auto& child : doc_) {
    if (isElement(child)) return &child.second;
  }
  return nullptr;
}

const ptree* GnupodDatabase::findPlaylist(const std::string& name) const {
  const ptree* root = rootElement();
  if (root == nullptr) return nullptr;

  for (const auto& child : *root) {
    if (child.first == "playlist" && attribute(child.second, "name") == name) {
      return &child.second;
    }
  }
  return nullptr;
}

void GnupodDatabase::setPlaylist(const std::string& name, const std::vector<TrackId>& ids) {
  ptree* root = rootElement();
  if (root == nullptr) {
    root = &doc_.add_child("gnuPod", ptree{});
  }

  ptree playlist;
  playlist.put(std::string(kAttrPrefix) + "name", name);
  std::string plid = playlistPlid(name);
  if (!plid.empty()) {
    playlist.put(std::string(kAttrPrefix) + "plid", plid);
  }
  for (TrackId id : ids) {
    ptree add;
    add.put(std::string(kAttrPrefix) + "id", id);
    playlist.push_back(ptree::value_type("add", add));
  }

  for (auto& child : *root) {
    if (child.first == "playlist" && attribute(child.second, "name") == name) {
      child.second = std::move(playlist);
      return;
    }
  }
  root->push_back(ptree::value_type("playlist", playlist));
}

bool GnupodDatabase::hasPlaylist(const std::string& name) const {
  return findPlaylist(name) != nullptr;
}

std::vector<TrackId> GnupodDatabase::playlistIds(const std::string& name) const {
  std::vector<TrackId> ids;
  const ptree* playlist = findPlaylist(name);
  if (playlist == nullptr) return ids;

  for (const auto& child : *playlist) {
    if (child.first != "add") continue;
    int64_t id = 0;
    if (parseNumber(attribute(child.second, "id"), id)) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::string GnupodDatabase::playlistPlid(const std::string& name) const {
  const ptree* playlist = findPlaylist(name);
  if (playlist == nullptr) return "";
  return attribute(*playlist, "plid");
}

bool GnupodDatabase::write(const std::string& path) {
  std::ofstream file(path);
  if (!file) {
    error_ = "Failed to open file for writing: " + path;
    return false;
  }
  if (!write(file)) {
    return false;
  }
  file.flush();
  if (!file) {
    error_ = "Failed to write file: " + path;
    return false;
  }
  return true;
}

bool GnupodDatabase::write(std::ostream& os) {
  error_.clear();
  try {
    boost::property_tree::write_xml(
        os, doc_, boost::property_tree::xml_writer_make_settings<std::string>(' ', 1));
  } catch (const boost::property_tree::xml_parser_error& e) {
    error_ = std::string("Failed to write XML: ") + e.what();
    return false;
  }
  if (!os) {
    error_ = "Failed to write XML: stream error";
    return false;
  }
  return true;
}

}  // namespace runthrough
