#include <cstring>
#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <cohanon/anonymiser.hpp>
#include <cohanon/header.hpp>
#include <cohanon/mmap.hpp>

namespace cohanon {

namespace {

bool fail(Error *outError, ErrorKind kind, const std::filesystem::path &path,
          std::string message) {
  if (outError) {
    outError->kind = kind;
    outError->path = path;
    outError->message = std::move(message);
  }
  return false;
}

// Map a source recording after checking it can hold a header
bool openSource(const std::filesystem::path &source, MappedFile &mapped, Error *outError) {
  std::error_code ec;
  const auto status = std::filesystem::status(source, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return fail(outError, ErrorKind::SourceRead, source,
                std::format("Source file does not exist: {}", source.string()));
  }
  if (ec) {
    return fail(outError, ErrorKind::SourceRead, source,
                std::format("Cannot access {}: {}", source.string(), ec.message()));
  }
  if (!std::filesystem::is_regular_file(status)) {
    return fail(outError, ErrorKind::SourceRead, source,
                std::format("Not a regular file: {}", source.string()));
  }

  auto size = std::filesystem::file_size(source, ec);
  if (ec) {
    return fail(outError, ErrorKind::SourceRead, source,
                std::format("Failed to get size of {}: {}", source.string(), ec.message()));
  }

  if (size < HeaderLayout::headerSize) {
    return fail(outError, ErrorKind::MalformedHeader, source,
                std::format("File too small to be a coh3 recording (size: {}, expected at least: {})",
                            size, HeaderLayout::headerSize));
  }

  std::string error;
  if (!mapped.openRead(source, &error)) {
    return fail(outError, ErrorKind::SourceRead, source, std::move(error));
  }
  return true;
}

// Write `bytes` to `<destination>.part` with the given permissions, then
// rename it over `destination`
bool storeRecording(const std::filesystem::path &destination, std::span<const uint8_t> bytes,
                    std::filesystem::perms permissions, Error *outError) {
  std::error_code ec;
  auto parent = destination.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return fail(outError, ErrorKind::DestinationWrite, destination,
                  std::format("Failed to create directory {}: {}", parent.string(), ec.message()));
    }
  }

  std::filesystem::path partPath = destination;
  partPath += ".part";

  std::string error;
  std::error_code ignored;
  {
    MappedFile output;
    if (!output.openWrite(partPath, bytes.size(), &error)) {
      std::filesystem::remove(partPath, ignored);
      return fail(outError, ErrorKind::DestinationWrite, destination, std::move(error));
    }

    std::filesystem::permissions(partPath, permissions, ec);
    if (ec) {
      output.close();
      std::filesystem::remove(partPath, ignored);
      return fail(outError, ErrorKind::DestinationWrite, destination,
                  std::format("Failed to set permissions on {}: {}", partPath.string(),
                              ec.message()));
    }

    std::memcpy(output.data().data(), bytes.data(), bytes.size());

    if (!output.flush(&error)) {
      output.close();
      std::filesystem::remove(partPath, ignored);
      return fail(outError, ErrorKind::DestinationWrite, destination, std::move(error));
    }
  }

  std::filesystem::rename(partPath, destination, ec);
  if (ec) {
    std::filesystem::remove(partPath, ignored);
    return fail(outError, ErrorKind::DestinationWrite, destination,
                std::format("Failed to move {} into place: {}", partPath.string(), ec.message()));
  }

  return true;
}

} // namespace

bool anonymiseBuffer(std::span<uint8_t> buffer, const ResolvedActions &actions, Error *outError) {
  if (buffer.size() < HeaderLayout::headerSize) {
    if (outError) {
      outError->kind = ErrorKind::MalformedHeader;
      outError->message = std::format("Buffer too small for a coh3 header (size: {}, expected: {})",
                                      buffer.size(), HeaderLayout::headerSize);
    }
    return false;
  }

  for (const auto &spec : fieldTable) {
    const FieldAction &action = actions[static_cast<size_t>(spec.field)];
    switch (action.kind) {
    case FieldAction::Kind::Unchanged:
      break;
    case FieldAction::Kind::Blank:
      if (!writeField(buffer, spec.field, {}, outError)) {
        return false;
      }
      break;
    case FieldAction::Kind::Replace:
      if (!writeField(buffer, spec.field, action.value, outError)) {
        return false;
      }
      break;
    }
  }

  return true;
}

bool anonymise(const std::filesystem::path &source, const std::filesystem::path &destination,
               const RedactionRequest &request, Error *outError) {
  std::vector<uint8_t> buffer;
  {
    MappedFile mapped;
    if (!openSource(source, mapped, outError)) {
      return false;
    }
    auto view = mapped.data();
    buffer.assign(view.begin(), view.end());
  }

  // The output keeps the source's mode, in place or mirrored
  std::error_code ec;
  auto permissions = std::filesystem::status(source, ec).permissions();
  if (ec || permissions == std::filesystem::perms::unknown) {
    permissions = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
  }

  if (!anonymiseBuffer(buffer, request.resolve(destination), outError)) {
    if (outError) {
      outError->path = source;
    }
    return false;
  }

  return storeRecording(destination, buffer, permissions, outError);
}

std::optional<HeaderRecord> inspect(const std::filesystem::path &path, Error *outError) {
  MappedFile mapped;
  if (!openSource(path, mapped, outError)) {
    return std::nullopt;
  }

  auto header = readHeader(mapped.data(), outError);
  if (!header && outError) {
    outError->path = path;
  }
  return header;
}

} // namespace cohanon
