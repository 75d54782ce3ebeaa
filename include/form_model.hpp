#pragma once

#include <optional>
#include <string>
#include <vector>

// Axis-aligned box in document coordinates. The decoder fixes the convention;
// everything produced by decodePdf uses a top-left origin with y growing down.
struct BoundingBox {
  double x0 = 0.0;
  double y0 = 0.0;
  double x1 = 0.0;
  double y1 = 0.0;

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  double centerX() const { return (x0 + x1) * 0.5; }
  double centerY() const { return (y0 + y1) * 0.5; }

  bool operator==(const BoundingBox& other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
  }
  bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

// Finite coordinates and non-negative extent on both axes.
bool isValidBox(const BoundingBox& box);

struct TextSpan {
  int pageNumber = 0;
  BoundingBox box;
  std::string text;
};

enum class FieldType {
  Text,
  Checkbox,
  RadioButton,
  Select,
  TextArea,
  Button,
  Signature
};

std::string toString(FieldType type);
// Throws std::runtime_error for names that are not one of toString's outputs.
FieldType fieldTypeFromString(const std::string& name);

struct FieldRecord {
  std::string fieldId;
  FieldType fieldType = FieldType::Text;
  std::string rawType;
  int pageNumber = 0;
  int pageOrder = 0;
  std::optional<std::string> nearText;
  std::optional<std::vector<std::string>> valueOptions;
  std::optional<BoundingBox> position;

  bool operator==(const FieldRecord& other) const;
  bool operator!=(const FieldRecord& other) const { return !(*this == other); }
};

struct DocumentMetadata {
  std::optional<std::string> title;
  std::optional<std::string> author;
  std::optional<std::string> subject;
  std::optional<std::string> creationDate;
  std::optional<std::string> modificationDate;
  int pageCount = 0;
};

enum class DiagnosticKind {
  MissingFieldName,
  MissingBoundingBox,
  InvalidBoundingBox,
  UnknownFieldKind,
  DuplicateFieldName
};

std::string toString(DiagnosticKind kind);
DiagnosticKind diagnosticKindFromString(const std::string& name);

// Out-of-band note about one control. The control itself is still emitted.
struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::MissingFieldName;
  int pageNumber = 0;
  int pageOrder = 0;
  std::string fieldId;
  std::string message;
};
