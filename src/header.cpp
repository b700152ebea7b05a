#include <algorithm>
#include <cstring>
#include <format>

#include <cohanon/header.hpp>

namespace cohanon {

std::string HeaderRecord::text(HeaderField field) const {
  const std::string &slot = raw(field);
  std::string result = slot.substr(0, slot.find('\0'));
  while (!result.empty() && result.back() == ' ') {
    result.pop_back();
  }
  return result;
}

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::SourceRead:
    return "SourceReadError";
  case ErrorKind::MalformedHeader:
    return "MalformedHeader";
  case ErrorKind::DestinationWrite:
    return "DestinationWriteError";
  case ErrorKind::ConversionFailed:
    return "ConversionFailed";
  }
  return "Unknown";
}

std::optional<HeaderField> fieldFromName(std::string_view name) {
  for (const auto &spec : fieldTable) {
    if (spec.name == name) {
      return spec.field;
    }
  }
  return std::nullopt;
}

std::optional<HeaderRecord> readHeader(std::span<const uint8_t> bytes, Error *outError) {
  if (bytes.size() < HeaderLayout::headerSize) {
    if (outError) {
      outError->kind = ErrorKind::MalformedHeader;
      outError->message = std::format("Buffer too small for a coh3 header (size: {}, expected: {})",
                                      bytes.size(), HeaderLayout::headerSize);
    }
    return std::nullopt;
  }

  HeaderRecord record;
  for (const auto &spec : fieldTable) {
    const char *start = reinterpret_cast<const char *>(bytes.data() + spec.offset);
    record.slots[static_cast<size_t>(spec.field)].assign(start, spec.width);
  }
  return record;
}

std::string encodeField(HeaderField field, std::string_view value) {
  const FieldSpec &spec = fieldSpec(field);

  auto nonAscii = std::find_if(value.begin(), value.end(),
                               [](char c) { return static_cast<unsigned char>(c) > 0x7F; });
  value = value.substr(0, static_cast<size_t>(nonAscii - value.begin()));
  value = value.substr(0, std::min(value.size(), spec.width));

  std::string slot(value);
  slot.resize(spec.width, static_cast<char>(HeaderLayout::blankByte));
  return slot;
}

bool writeField(std::span<uint8_t> buffer, HeaderField field, std::string_view value,
                Error *outError) {
  const FieldSpec &spec = fieldSpec(field);
  if (spec.offset + spec.width > buffer.size()) {
    if (outError) {
      outError->kind = ErrorKind::MalformedHeader;
      outError->message =
          std::format("Field '{}' extends beyond buffer bounds (offset={}, width={}, size={})",
                      spec.name, spec.offset, spec.width, buffer.size());
    }
    return false;
  }

  std::string slot = encodeField(field, value);
  std::memcpy(buffer.data() + spec.offset, slot.data(), spec.width);
  return true;
}

} // namespace cohanon
