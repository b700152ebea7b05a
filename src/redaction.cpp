#include <algorithm>
#include <utility>

#include <cohanon/redaction.hpp>

namespace cohanon {

RedactionRequest RedactionRequest::fromToggles(const RedactionToggles &toggles) {
  RedactionRequest request;

  const std::pair<HeaderField, bool> switches[] = {
      {HeaderField::Name, toggles.name},       {HeaderField::Surname, toggles.surname},
      {HeaderField::Birthdate, toggles.birthdate}, {HeaderField::Sex, toggles.sex},
      {HeaderField::Folder, toggles.folder},   {HeaderField::Centre, toggles.centre},
      {HeaderField::Comment, toggles.comment},
  };
  for (const auto &[field, enabled] : switches) {
    if (enabled) {
      request.set(field, FieldAction::blank());
    }
  }

  request.setRedactAll(toggles.redactAll);
  request.setDeriveNameFromFolder(toggles.deriveNameFromFolder);
  return request;
}

RedactionRequest &RedactionRequest::set(HeaderField field, FieldAction action) {
  fields_[static_cast<size_t>(field)] = std::move(action);
  return *this;
}

RedactionRequest &RedactionRequest::clear(HeaderField field) {
  fields_[static_cast<size_t>(field)].reset();
  return *this;
}

RedactionRequest &RedactionRequest::setRedactAll(bool enabled) {
  redactAll_ = enabled;
  return *this;
}

RedactionRequest &RedactionRequest::setDeriveNameFromFolder(bool enabled) {
  deriveNameFromFolder_ = enabled;
  return *this;
}

ResolvedActions RedactionRequest::resolve(const std::filesystem::path &destination) const {
  ResolvedActions actions;

  for (size_t i = 0; i < fieldCount; ++i) {
    if (fields_[i]) {
      actions[i] = *fields_[i];
    } else if (redactAll_) {
      actions[i] = FieldAction::blank();
    } else {
      actions[i] = FieldAction::unchanged();
    }
  }

  if (deriveNameFromFolder_) {
    actions[static_cast<size_t>(HeaderField::Name)] =
        FieldAction::replaceWith(containingFolderName(destination));
  }

  return actions;
}

bool RedactionRequest::isPassThrough() const {
  if (redactAll_ || deriveNameFromFolder_) {
    return false;
  }
  return std::all_of(fields_.begin(), fields_.end(), [](const auto &action) {
    return !action || action->kind == FieldAction::Kind::Unchanged;
  });
}

std::string containingFolderName(const std::filesystem::path &destination) {
  // Strip a trailing separator so "a/b/" and "a/b" agree
  std::filesystem::path parent = destination.parent_path();
  if (!parent.empty() && !parent.has_filename()) {
    parent = parent.parent_path();
  }
  return parent.filename().string();
}

} // namespace cohanon
