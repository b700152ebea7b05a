#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "types.hpp"

namespace cohanon {

// What to do with one header field
struct FieldAction {
  enum class Kind {
    Unchanged, // Pass the slot through byte-for-byte
    Blank,     // Fill the slot with HeaderLayout::blankByte
    Replace,   // Write `value`, truncated or padded to the slot width
  };

  Kind kind = Kind::Unchanged;
  std::string value;

  static FieldAction unchanged() { return {}; }
  static FieldAction blank() { return {Kind::Blank, {}}; }
  static FieldAction replaceWith(std::string value) { return {Kind::Replace, std::move(value)}; }

  bool operator==(const FieldAction &) const = default;
};

// Effective action of every field, indexed by HeaderField
using ResolvedActions = std::array<FieldAction, fieldCount>;

// Per-field switches of the redaction dialog: true redacts the field
struct RedactionToggles {
  bool name = false;
  bool surname = false;
  bool birthdate = false;
  bool sex = false;
  bool folder = false;
  bool centre = false;
  bool comment = false;
  bool redactAll = false;
  bool deriveNameFromFolder = false;
};

// Caller intent for one batch run, shared read-only by all file tasks.
//
// Precedence when resolving a field:
//   1. an explicit per-field action
//   2. Blank if redactAll is set
//   3. Unchanged
// deriveNameFromFolder then replaces the name field, and only that field, with
// the last segment of the destination directory.
class RedactionRequest {
public:
  RedactionRequest() = default;

  // Toggles set to true become explicit Blank actions; the others stay unset
  static RedactionRequest fromToggles(const RedactionToggles &toggles);

  RedactionRequest &set(HeaderField field, FieldAction action);
  RedactionRequest &clear(HeaderField field);
  RedactionRequest &setRedactAll(bool enabled);
  RedactionRequest &setDeriveNameFromFolder(bool enabled);

  const std::optional<FieldAction> &explicitAction(HeaderField field) const {
    return fields_[static_cast<size_t>(field)];
  }

  bool redactAll() const { return redactAll_; }
  bool deriveNameFromFolder() const { return deriveNameFromFolder_; }

  // Effective actions for a file written to `destination`
  ResolvedActions resolve(const std::filesystem::path &destination) const;

  // True if resolving can only produce Unchanged actions
  bool isPassThrough() const;

private:
  std::array<std::optional<FieldAction>, fieldCount> fields_;
  bool redactAll_ = false;
  bool deriveNameFromFolder_ = false;
};

// Last path segment of the directory containing `destination`
std::string containingFolderName(const std::filesystem::path &destination);

} // namespace cohanon
