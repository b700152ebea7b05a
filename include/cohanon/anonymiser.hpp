#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

#include "redaction.hpp"
#include "types.hpp"

namespace cohanon {

// Apply resolved actions to a whole-file buffer through the field codec.
// Fails with MalformedHeader if the buffer is shorter than the header.
bool anonymiseBuffer(std::span<uint8_t> buffer, const ResolvedActions &actions,
                     Error *outError = nullptr);

// Anonymise one recording.
//
// The source is read entirely into memory, the request is resolved against the
// destination path and applied, and the result is written to
// "<destination>.part" then renamed over the destination. Missing parent
// directories are created. On failure no partial destination is left behind.
//
// The source and destination may be the same file. Concurrent calls are safe
// as long as their destinations differ and no call's destination is another
// call's source.
//
// Errors: SourceRead, MalformedHeader, DestinationWrite.
bool anonymise(const std::filesystem::path &source, const std::filesystem::path &destination,
               const RedactionRequest &request, Error *outError = nullptr);

// Read only the header of a recording
std::optional<HeaderRecord> inspect(const std::filesystem::path &path, Error *outError = nullptr);

} // namespace cohanon
