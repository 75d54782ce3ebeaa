#pragma once

#include "errors.hpp"
#include "form_model.hpp"

#include <optional>
#include <string>
#include <vector>

enum class DiffStatus { Equal, Different, NotApplicable };

// Declaration order is the report order.
enum class ChangeStatus { Removed, Added, Modified, Unchanged };

std::string toString(DiffStatus status);
std::string toString(ChangeStatus status);

struct DiffOptions {
  double positionTolerance = 1.0;   // per edge, document units
  bool normalizeNearText = false;   // trim, collapse whitespace, ASCII case-fold
};

struct FieldChange {
  std::string fieldId;
  ChangeStatus status = ChangeStatus::Unchanged;
  FieldType fieldType = FieldType::Text;
  std::string rawType;

  std::optional<int> sourcePageNumber;
  std::optional<int> targetPageNumber;
  std::optional<int> sourcePageOrder;
  std::optional<int> targetPageOrder;
  DiffStatus pageChange = DiffStatus::NotApplicable;

  DiffStatus fieldTypeChange = DiffStatus::NotApplicable;
  std::optional<FieldType> sourceFieldType;
  std::optional<FieldType> targetFieldType;

  DiffStatus nearTextDiff = DiffStatus::NotApplicable;
  std::optional<std::string> sourceNearText;
  std::optional<std::string> targetNearText;

  DiffStatus valueOptionsDiff = DiffStatus::NotApplicable;
  std::optional<std::vector<std::string>> sourceValueOptions;
  std::optional<std::vector<std::string>> targetValueOptions;

  DiffStatus positionChange = DiffStatus::NotApplicable;
  std::optional<BoundingBox> sourcePosition;
  std::optional<BoundingBox> targetPosition;
};

template <typename T>
struct ValuePair {
  T source{};
  T target{};
  DiffStatus status = DiffStatus::Equal;
};

struct MetadataDiff {
  ValuePair<std::optional<std::string>> title;
  ValuePair<std::optional<std::string>> author;
  ValuePair<std::optional<std::string>> subject;
  ValuePair<std::optional<std::string>> creationDate;
  ValuePair<std::optional<std::string>> modificationDate;
};

struct GlobalMetrics {
  ValuePair<int> pageCount;
  ValuePair<int> fieldCount;
  MetadataDiff metadata;
  int fieldsAdded = 0;
  int fieldsRemoved = 0;
  int fieldsModified = 0;
  int fieldsUnchanged = 0;
  double modificationPercentage = 0.0;
};

struct ComparisonResult {
  GlobalMetrics globalMetrics;
  // Removed, then added, then modified, then unchanged. Within a status,
  // ordered by source (page, order); added fields by target (page, order).
  std::vector<FieldChange> fieldChanges;
};

// Edge-wise comparison; a null box only equals another null box.
DiffStatus comparePositions(const std::optional<BoundingBox>& source,
                            const std::optional<BoundingBox>& target,
                            double tolerance);

// Compares two independently extracted field sets joined on fieldId.
// Throws DuplicateFieldIdError if either side repeats an id.
ComparisonResult compareFields(const std::vector<FieldRecord>& sourceFields,
                               const std::vector<FieldRecord>& targetFields,
                               const DocumentMetadata& sourceMeta,
                               const DocumentMetadata& targetMeta,
                               const DiffOptions& options = {});
