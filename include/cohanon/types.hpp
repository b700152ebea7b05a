#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace cohanon {

// Patient fields of the coh3 header
enum class HeaderField : uint8_t {
  Name,
  Surname,
  Birthdate,
  Sex,
  Folder,
  Centre,
  Comment,
};

inline constexpr size_t fieldCount = 7;

// Location of one field inside the header
struct FieldSpec {
  HeaderField field;
  std::string_view name;
  size_t offset = 0; // Byte offset from the start of the file
  size_t width = 0;  // Slot width in bytes
};

// coh3 header layout (719 bytes up to the end of the comment slot)
struct HeaderLayout {
  static constexpr unsigned version = 1;
  static constexpr size_t headerSize = 719;
  static constexpr uint8_t blankByte = 0x00; // Padding and blank sentinel
};

// Raw header slots, each exactly as wide as its field
struct HeaderRecord {
  std::array<std::string, fieldCount> slots;

  const std::string &raw(HeaderField field) const { return slots[static_cast<size_t>(field)]; }

  // Slot content up to the first NUL, trailing spaces removed
  std::string text(HeaderField field) const;
};

enum class ErrorKind {
  None,
  SourceRead,
  MalformedHeader,
  DestinationWrite,
  ConversionFailed,
};

const char *toString(ErrorKind kind);

// Structured failure returned through the outError parameters
struct Error {
  ErrorKind kind = ErrorKind::None;
  std::filesystem::path path; // File the failure concerns
  std::string message;
  std::string diagnostics; // Captured converter output

  explicit operator bool() const { return kind != ErrorKind::None; }
};

} // namespace cohanon
