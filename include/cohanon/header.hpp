#pragma once

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cohanon {

// Field table of the coh3 header, layout version 1.
// Offsets and widths come from the Deltamed Coherence patient block.
inline constexpr std::array<FieldSpec, fieldCount> fieldTable = {{
    {HeaderField::Name, "name", 314, 50},
    {HeaderField::Surname, "surname", 364, 30},
    {HeaderField::Birthdate, "birthdate", 394, 10},
    {HeaderField::Sex, "sex", 404, 1},
    {HeaderField::Folder, "folder", 405, 20},
    {HeaderField::Centre, "centre", 425, 39},
    {HeaderField::Comment, "comment", 464, 255},
}};

inline constexpr const FieldSpec &fieldSpec(HeaderField field) noexcept {
  return fieldTable[static_cast<size_t>(field)];
}

inline constexpr std::string_view fieldName(HeaderField field) noexcept {
  return fieldSpec(field).name;
}

// Lookup by lowercase field name ("name", "surname", ...)
std::optional<HeaderField> fieldFromName(std::string_view name);

// Parse every field from the leading bytes of a coh3 file
// Returns std::nullopt (MalformedHeader) if the buffer is shorter than the header
std::optional<HeaderRecord> readHeader(std::span<const uint8_t> bytes, Error *outError = nullptr);

// Exact-width slot content for a value.
// The value is cut at its first non-ASCII byte, then to the slot width, then
// padded with HeaderLayout::blankByte. The loss is silent.
std::string encodeField(HeaderField field, std::string_view value);

// Overwrite one field in place; the buffer size never changes
bool writeField(std::span<uint8_t> buffer, HeaderField field, std::string_view value,
                Error *outError = nullptr);

} // namespace cohanon
