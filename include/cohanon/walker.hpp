#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace cohanon {

// Lazy recursive enumeration of the files under a root directory.
//
// Each directory is listed and sorted when the walk enters it, so two walks
// over an unchanged tree yield the same sequence. The order is that of
// std::filesystem::path, which compares element by element: "a/x.eeg" comes
// before "a.eeg" because the element "a" sorts before "a.eeg". This differs
// from comparing the full path strings. Paths are absolute.
class FileWalker {
public:
  // `extension` is matched case-insensitively (".eeg" matches "A.EEG");
  // an empty extension matches every regular file
  FileWalker(const std::filesystem::path &root, std::string extension = {});

  // Next matching file, or std::nullopt when the walk is over or failed
  std::optional<std::filesystem::path> next();

  // Set once a directory could not be listed
  const Error &error() const { return error_; }
  bool failed() const { return static_cast<bool>(error_); }

private:
  struct Level {
    std::vector<std::filesystem::directory_entry> entries;
    size_t index = 0;
  };

  bool enter(const std::filesystem::path &directory);
  bool matches(const std::filesystem::path &path) const;

  std::string extension_; // Lowercase
  std::vector<Level> stack_;
  Error error_;
};

// Every matching file under `root`, in walk order
std::optional<std::vector<std::filesystem::path>>
listFiles(const std::filesystem::path &root, const std::string &extension = ".eeg",
          Error *outError = nullptr);

// `source` relocated from `sourceRoot` to `destinationRoot`, keeping its relative path
std::filesystem::path mirrorPath(const std::filesystem::path &source,
                                 const std::filesystem::path &sourceRoot,
                                 const std::filesystem::path &destinationRoot);

// True if both roots name the same directory (the batch would run in place)
bool isInPlace(const std::filesystem::path &sourceRoot,
               const std::filesystem::path &destinationRoot);

// Parts of a split recording: files whose name starts with "<prefix>_"
std::vector<std::filesystem::path> findFragments(const std::string &prefix,
                                                 std::span<const std::filesystem::path> files);

} // namespace cohanon
