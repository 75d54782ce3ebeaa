#include "form_model.hpp"

#include <cmath>
#include <stdexcept>

bool isValidBox(const BoundingBox& box) {
  if (!std::isfinite(box.x0) || !std::isfinite(box.y0) ||
      !std::isfinite(box.x1) || !std::isfinite(box.y1)) {
    return false;
  }
  return box.width() >= 0.0 && box.height() >= 0.0;
}

std::string toString(FieldType type) {
  switch (type) {
    case FieldType::Text: return "text";
    case FieldType::Checkbox: return "checkbox";
    case FieldType::RadioButton: return "radiobutton";
    case FieldType::Select: return "select";
    case FieldType::TextArea: return "textarea";
    case FieldType::Button: return "button";
    case FieldType::Signature: return "signature";
  }
  return "button";
}

FieldType fieldTypeFromString(const std::string& name) {
  if (name == "text") return FieldType::Text;
  if (name == "checkbox") return FieldType::Checkbox;
  if (name == "radiobutton") return FieldType::RadioButton;
  if (name == "select") return FieldType::Select;
  if (name == "textarea") return FieldType::TextArea;
  if (name == "button") return FieldType::Button;
  if (name == "signature") return FieldType::Signature;
  throw std::runtime_error("unknown field type: " + name);
}

bool FieldRecord::operator==(const FieldRecord& other) const {
  return fieldId == other.fieldId &&
         fieldType == other.fieldType &&
         rawType == other.rawType &&
         pageNumber == other.pageNumber &&
         pageOrder == other.pageOrder &&
         nearText == other.nearText &&
         valueOptions == other.valueOptions &&
         position == other.position;
}

std::string toString(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::MissingFieldName: return "missing_field_name";
    case DiagnosticKind::MissingBoundingBox: return "missing_bounding_box";
    case DiagnosticKind::InvalidBoundingBox: return "invalid_bounding_box";
    case DiagnosticKind::UnknownFieldKind: return "unknown_field_kind";
    case DiagnosticKind::DuplicateFieldName: return "duplicate_field_name";
  }
  return "unknown_field_kind";
}

DiagnosticKind diagnosticKindFromString(const std::string& name) {
  if (name == "missing_field_name") return DiagnosticKind::MissingFieldName;
  if (name == "missing_bounding_box") return DiagnosticKind::MissingBoundingBox;
  if (name == "invalid_bounding_box") return DiagnosticKind::InvalidBoundingBox;
  if (name == "unknown_field_kind") return DiagnosticKind::UnknownFieldKind;
  if (name == "duplicate_field_name") return DiagnosticKind::DuplicateFieldName;
  throw std::runtime_error("unknown diagnostic kind: " + name);
}
