/**
 * @file gnupod_database.h
 * @brief GNUpod database (GNUtunesDB.xml) reader and playlist writer.
 */

#ifndef RUNTHROUGH_CATALOG_GNUPOD_DATABASE_H
#define RUNTHROUGH_CATALOG_GNUPOD_DATABASE_H

#include <boost/property_tree/ptree.hpp>
#include <iosfwd>
#include <string>
#include <vector>

#include "core/types.h"

namespace runthrough {

/**
 * @brief In-memory GNUpod database document.
 *
 * The document is kept as a property tree so that everything runthrough
 * does not know about (other attributes, other playlists) is written back
 * untouched. Tracks are read from the `<file>` elements of the root's
 * `<files>` child:
 *
 * @code
 * <gnuPod>
 *   <files>
 *     <file id="1" title="..." album="..." rating="60" playcount="3" lastplay="..."/>
 *   </files>
 *   <playlist name="Runthrough" plid="17"><add id="1"/></playlist>
 * </gnuPod>
 * @endcode
 */
class GnupodDatabase {
 public:
  /**
   * @brief Read a database from disk.
   * @param path Path to the XML document
   * @return true on success, false on error
   */
  bool read(const std::string& path);

  /**
   * @brief Read a database from a stream.
   * @param is Stream holding the XML document
   * @return true on success, false on error
   */
  bool read(std::istream& is);

  /**
   * @brief Get the tracks of the last successful read, in document order.
   * @return Reference to the catalog
   */
  const Catalog& tracks() const { return tracks_; }

  /**
   * @brief Insert or replace a named playlist.
   *
   * An existing playlist of that name is replaced in place and keeps its
   * plid. Otherwise the playlist is appended to the root element.
   *
   * @param name Playlist name
   * @param ids Track identifiers in playback order
   */
  void setPlaylist(const std::string& name, const std::vector<TrackId>& ids);

  /// @brief Check whether a playlist of that name exists.
  bool hasPlaylist(const std::string& name) const;

  /// @brief Track identifiers of a playlist (empty if it does not exist).
  std::vector<TrackId> playlistIds(const std::string& name) const;

  /// @brief plid attribute of a playlist (empty if absent).
  std::string playlistPlid(const std::string& name) const;

  /**
   * @brief Write the document to disk.
   * @param path Output path
   * @return true on success, false on error
   */
  bool write(const std::string& path);

  /**
   * @brief Write the document to a stream as indented XML.
   * @param os Output stream
   * @return true on success, false on error
   */
  bool write(std::ostream& os);

  /**
   * @brief Get error message if read() or write() failed.
   * @return Error string
   */
  const std::string& getError() const { return error_; }

 private:
  bool loadTracks();
  boost::property_tree::ptree* rootElement();
  const boost::property_tree::ptree* rootElement() const;
  const boost::property_tree::ptree* findPlaylist(const std::string& name) const;

  boost::property_tree::ptree doc_;
  Catalog tracks_;
  std::string error_;
};

}  // namespace runthrough

#endif  // RUNTHROUGH_CATALOG_GNUPOD_DATABASE_H
