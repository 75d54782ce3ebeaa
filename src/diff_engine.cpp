#include "diff_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <tuple>
#include <unordered_map>

namespace {

using FieldIndex = std::unordered_map<std::string, const FieldRecord*>;

FieldIndex indexById(const std::vector<FieldRecord>& fields, const std::string& side) {
  FieldIndex index;
  index.reserve(fields.size());
  for (const auto& f : fields) {
    if (!index.emplace(f.fieldId, &f).second) {
      throw DuplicateFieldIdError(f.fieldId, side);
    }
  }
  return index;
}

std::string normalizeLabel(const std::string& s) {
  std::string out;
  bool pendingSpace = false;
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isspace(c)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out.push_back(' ');
      pendingSpace = false;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

DiffStatus compareNearText(const std::optional<std::string>& a,
                           const std::optional<std::string>& b,
                           bool normalize) {
  if (!a || !b) return (!a && !b) ? DiffStatus::Equal : DiffStatus::Different;
  if (normalize) return normalizeLabel(*a) == normalizeLabel(*b) ? DiffStatus::Equal : DiffStatus::Different;
  return *a == *b ? DiffStatus::Equal : DiffStatus::Different;
}

template <typename T>
DiffStatus equality(const T& a, const T& b) {
  return a == b ? DiffStatus::Equal : DiffStatus::Different;
}

template <typename T>
ValuePair<T> makePair(const T& source, const T& target) {
  return ValuePair<T>{source, target, equality(source, target)};
}

FieldChange addedChange(const FieldRecord& t) {
  FieldChange c;
  c.fieldId = t.fieldId;
  c.status = ChangeStatus::Added;
  c.fieldType = t.fieldType;
  c.rawType = t.rawType;
  c.targetPageNumber = t.pageNumber;
  c.targetPageOrder = t.pageOrder;
  c.targetFieldType = t.fieldType;
  c.targetNearText = t.nearText;
  c.targetValueOptions = t.valueOptions;
  c.targetPosition = t.position;
  return c;
}

FieldChange removedChange(const FieldRecord& s) {
  FieldChange c;
  c.fieldId = s.fieldId;
  c.status = ChangeStatus::Removed;
  c.fieldType = s.fieldType;
  c.rawType = s.rawType;
  c.sourcePageNumber = s.pageNumber;
  c.sourcePageOrder = s.pageOrder;
  c.sourceFieldType = s.fieldType;
  c.sourceNearText = s.nearText;
  c.sourceValueOptions = s.valueOptions;
  c.sourcePosition = s.position;
  return c;
}

FieldChange matchedChange(const FieldRecord& s, const FieldRecord& t, const DiffOptions& options) {
  FieldChange c;
  c.fieldId = s.fieldId;
  c.fieldType = s.fieldType;
  c.rawType = s.rawType;

  c.sourcePageNumber = s.pageNumber;
  c.targetPageNumber = t.pageNumber;
  c.sourcePageOrder = s.pageOrder;
  c.targetPageOrder = t.pageOrder;
  c.pageChange = equality(s.pageNumber, t.pageNumber);

  c.sourceFieldType = s.fieldType;
  c.targetFieldType = t.fieldType;
  c.fieldTypeChange = equality(s.fieldType, t.fieldType);

  c.sourceNearText = s.nearText;
  c.targetNearText = t.nearText;
  c.nearTextDiff = compareNearText(s.nearText, t.nearText, options.normalizeNearText);

  c.sourceValueOptions = s.valueOptions;
  c.targetValueOptions = t.valueOptions;
  c.valueOptionsDiff = equality(s.valueOptions, t.valueOptions);

  c.sourcePosition = s.position;
  c.targetPosition = t.position;
  c.positionChange = comparePositions(s.position, t.position, options.positionTolerance);

  // fieldTypeChange is reported only; it does not affect the status.
  const bool modified = c.pageChange == DiffStatus::Different ||
                        c.nearTextDiff == DiffStatus::Different ||
                        c.valueOptionsDiff == DiffStatus::Different ||
                        c.positionChange == DiffStatus::Different;
  c.status = modified ? ChangeStatus::Modified : ChangeStatus::Unchanged;
  return c;
}

std::tuple<int, int, int, std::string> sortKey(const FieldChange& c) {
  if (c.status == ChangeStatus::Added) {
    return std::make_tuple(static_cast<int>(c.status), *c.targetPageNumber, *c.targetPageOrder, c.fieldId);
  }
  return std::make_tuple(static_cast<int>(c.status), *c.sourcePageNumber, *c.sourcePageOrder, c.fieldId);
}

} // namespace

std::string toString(DiffStatus status) {
  switch (status) {
    case DiffStatus::Equal: return "equal";
    case DiffStatus::Different: return "different";
    case DiffStatus::NotApplicable: return "not_applicable";
  }
  return "not_applicable";
}

std::string toString(ChangeStatus status) {
  switch (status) {
    case ChangeStatus::Removed: return "removed";
    case ChangeStatus::Added: return "added";
    case ChangeStatus::Modified: return "modified";
    case ChangeStatus::Unchanged: return "unchanged";
  }
  return "unchanged";
}

DiffStatus comparePositions(const std::optional<BoundingBox>& source,
                            const std::optional<BoundingBox>& target,
                            double tolerance) {
  if (!source || !target) return (!source && !target) ? DiffStatus::Equal : DiffStatus::Different;
  const double edges[4][2] = {
    {source->x0, target->x0},
    {source->y0, target->y0},
    {source->x1, target->x1},
    {source->y1, target->y1},
  };
  for (const auto& e : edges) {
    if (!(std::abs(e[0] - e[1]) <= tolerance)) return DiffStatus::Different;
  }
  return DiffStatus::Equal;
}

ComparisonResult compareFields(const std::vector<FieldRecord>& sourceFields,
                               const std::vector<FieldRecord>& targetFields,
                               const DocumentMetadata& sourceMeta,
                               const DocumentMetadata& targetMeta,
                               const DiffOptions& options) {
  const FieldIndex sourceIndex = indexById(sourceFields, "source");
  const FieldIndex targetIndex = indexById(targetFields, "target");

  ComparisonResult result;
  GlobalMetrics& m = result.globalMetrics;

  for (const auto& s : sourceFields) {
    auto match = targetIndex.find(s.fieldId);
    if (match == targetIndex.end()) {
      result.fieldChanges.push_back(removedChange(s));
      m.fieldsRemoved++;
      continue;
    }
    FieldChange c = matchedChange(s, *match->second, options);
    if (c.status == ChangeStatus::Modified) {
      m.fieldsModified++;
    } else {
      m.fieldsUnchanged++;
    }
    result.fieldChanges.push_back(std::move(c));
  }
  for (const auto& t : targetFields) {
    if (sourceIndex.count(t.fieldId)) continue;
    result.fieldChanges.push_back(addedChange(t));
    m.fieldsAdded++;
  }

  std::sort(result.fieldChanges.begin(), result.fieldChanges.end(),
            [](const FieldChange& a, const FieldChange& b) { return sortKey(a) < sortKey(b); });

  m.pageCount = makePair(sourceMeta.pageCount, targetMeta.pageCount);
  m.fieldCount = makePair(static_cast<int>(sourceFields.size()), static_cast<int>(targetFields.size()));
  m.metadata.title = makePair(sourceMeta.title, targetMeta.title);
  m.metadata.author = makePair(sourceMeta.author, targetMeta.author);
  m.metadata.subject = makePair(sourceMeta.subject, targetMeta.subject);
  m.metadata.creationDate = makePair(sourceMeta.creationDate, targetMeta.creationDate);
  m.metadata.modificationDate = makePair(sourceMeta.modificationDate, targetMeta.modificationDate);

  const size_t universe = result.fieldChanges.size();
  if (universe > 0) {
    const int changed = m.fieldsAdded + m.fieldsRemoved + m.fieldsModified;
    m.modificationPercentage = static_cast<double>(changed) / static_cast<double>(universe) * 100.0;
  }

  return result;
}
