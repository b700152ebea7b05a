#include <algorithm>
#include <cctype>
#include <format>
#include <system_error>
#include <utility>

#include <cohanon/walker.hpp>

namespace cohanon {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Absolute, normalised, without a trailing separator
std::filesystem::path absoluteNormal(const std::filesystem::path &path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  auto normal = (ec ? path : absolute).lexically_normal();
  if (!normal.has_filename() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

} // namespace

FileWalker::FileWalker(const std::filesystem::path &root, std::string extension)
    : extension_(toLower(std::move(extension))) {
  if (!extension_.empty() && extension_.front() != '.') {
    extension_.insert(extension_.begin(), '.');
  }

  auto start = absoluteNormal(root);
  std::error_code ec;
  if (!std::filesystem::is_directory(start, ec)) {
    error_.kind = ErrorKind::SourceRead;
    error_.path = start;
    error_.message = std::format("Not a directory: {}", start.string());
    return;
  }

  enter(start);
}

bool FileWalker::enter(const std::filesystem::path &directory) {
  Level level;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    level.entries.push_back(*it);
  }

  if (ec) {
    error_.kind = ErrorKind::SourceRead;
    error_.path = directory;
    error_.message = std::format("Failed to list directory {}: {}", directory.string(), ec.message());
    stack_.clear();
    return false;
  }

  std::sort(level.entries.begin(), level.entries.end(),
            [](const auto &a, const auto &b) { return a.path() < b.path(); });
  stack_.push_back(std::move(level));
  return true;
}

bool FileWalker::matches(const std::filesystem::path &path) const {
  return extension_.empty() || toLower(path.extension().string()) == extension_;
}

std::optional<std::filesystem::path> FileWalker::next() {
  while (!stack_.empty() && !failed()) {
    Level &level = stack_.back();
    if (level.index >= level.entries.size()) {
      stack_.pop_back();
      continue;
    }

    // Copy: enter() may reallocate the stack
    std::filesystem::directory_entry entry = level.entries[level.index++];

    std::error_code ec;
    if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
      if (!enter(entry.path())) {
        return std::nullopt;
      }
      continue;
    }

    if (entry.is_regular_file(ec) && matches(entry.path())) {
      return entry.path();
    }
  }
  return std::nullopt;
}

std::optional<std::vector<std::filesystem::path>>
listFiles(const std::filesystem::path &root, const std::string &extension, Error *outError) {
  FileWalker walker(root, extension);
  std::vector<std::filesystem::path> files;
  while (auto file = walker.next()) {
    files.push_back(std::move(*file));
  }

  if (walker.failed()) {
    if (outError) {
      *outError = walker.error();
    }
    return std::nullopt;
  }
  return files;
}

std::filesystem::path mirrorPath(const std::filesystem::path &source,
                                 const std::filesystem::path &sourceRoot,
                                 const std::filesystem::path &destinationRoot) {
  auto relative = absoluteNormal(source).lexically_relative(absoluteNormal(sourceRoot));
  if (relative.empty() || *relative.begin() == "..") {
    relative = source.filename();
  }
  return destinationRoot / relative;
}

bool isInPlace(const std::filesystem::path &sourceRoot,
               const std::filesystem::path &destinationRoot) {
  if (destinationRoot.empty()) {
    return true;
  }

  std::error_code ec;
  if (std::filesystem::equivalent(sourceRoot, destinationRoot, ec)) {
    return true;
  }

  std::error_code sourceEc, destinationEc;
  auto source = std::filesystem::weakly_canonical(sourceRoot, sourceEc);
  auto destination = std::filesystem::weakly_canonical(destinationRoot, destinationEc);
  if (sourceEc || destinationEc) {
    return absoluteNormal(sourceRoot) == absoluteNormal(destinationRoot);
  }
  return absoluteNormal(source) == absoluteNormal(destination);
}

std::vector<std::filesystem::path> findFragments(const std::string &prefix,
                                                 std::span<const std::filesystem::path> files) {
  const std::string stem = prefix + "_";
  std::vector<std::filesystem::path> fragments;
  for (const auto &file : files) {
    if (file.filename().string().starts_with(stem)) {
      fragments.push_back(file);
    }
  }
  return fragments;
}

} // namespace cohanon
