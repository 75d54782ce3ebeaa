#include "extractor.hpp"

#include "near_label.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <regex>
#include <sstream>
#include <string>

namespace {

constexpr int kFlagMultiline = 1 << 12;
constexpr int kFlagRadio = 1 << 15;
constexpr int kFlagPushButton = 1 << 16;

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string canonicalKind(const std::string& kind) {
  std::string out;
  for (char ch : trim(kind)) {
    if (ch == '/' || ch == '_' || ch == '-' || ch == ' ') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string fallbackFieldId(int pageNumber, int pageOrder) {
  std::ostringstream oss;
  oss << "field_" << pageNumber << "_" << std::setw(3) << std::setfill('0') << pageOrder;
  return oss.str();
}

Diagnostic makeDiagnostic(DiagnosticKind kind, const FieldRecord& record, const std::string& message) {
  Diagnostic d;
  d.kind = kind;
  d.pageNumber = record.pageNumber;
  d.pageOrder = record.pageOrder;
  d.fieldId = record.fieldId;
  d.message = message;
  return d;
}

void validatePages(const DecodedDocument& document) {
  const int decoded = static_cast<int>(document.pages.size());
  if (document.metadata.pageCount != decoded) {
    throw DecodeError("metadata reports " + std::to_string(document.metadata.pageCount) +
                      " page(s) but " + std::to_string(decoded) + " were decoded");
  }
  for (int i = 0; i < decoded; ++i) {
    if (document.pages[i].pageNumber != i + 1) {
      throw DecodeError("page " + std::to_string(i + 1) + " is numbered " +
                        std::to_string(document.pages[i].pageNumber), i + 1);
    }
  }
}

} // namespace

FieldTypeMapping normalizeFieldType(const std::string& nativeKind, int flags) {
  const std::string kind = canonicalKind(nativeKind);

  if (kind == "tx" || kind == "text" || kind == "textfield" || kind == "textbox" ||
      kind == "edit" || kind == "input") {
    return {(flags & kFlagMultiline) ? FieldType::TextArea : FieldType::Text, true};
  }
  if (kind == "textarea" || kind == "multiline") return {FieldType::TextArea, true};

  if (kind == "btn") {
    if (flags & kFlagPushButton) return {FieldType::Button, true};
    if (flags & kFlagRadio) return {FieldType::RadioButton, true};
    return {FieldType::Checkbox, true};
  }
  if (kind == "checkbox" || kind == "check" || kind == "toggle") return {FieldType::Checkbox, true};
  if (kind == "radio" || kind == "radiobutton" || kind == "radiogroup") return {FieldType::RadioButton, true};
  if (kind == "button" || kind == "pushbutton" || kind == "submit" || kind == "reset") {
    return {FieldType::Button, true};
  }

  if (kind == "ch" || kind == "choice" || kind == "select" || kind == "combobox" ||
      kind == "combo" || kind == "listbox" || kind == "list" || kind == "dropdown") {
    return {FieldType::Select, true};
  }

  if (kind == "sig" || kind == "signature" || kind == "ink" || kind == "drawing") {
    return {FieldType::Signature, true};
  }

  // Unknown spelling: closest bucket by name fragment.
  if (contains(kind, "radio")) return {FieldType::RadioButton, false};
  if (contains(kind, "check") || contains(kind, "toggle")) return {FieldType::Checkbox, false};
  if (contains(kind, "list") || contains(kind, "combo") || contains(kind, "choice") ||
      contains(kind, "select")) {
    return {FieldType::Select, false};
  }
  if (contains(kind, "sign") || contains(kind, "ink") || contains(kind, "draw")) {
    return {FieldType::Signature, false};
  }
  if (contains(kind, "multiline") || contains(kind, "area")) return {FieldType::TextArea, false};
  if (contains(kind, "text") || contains(kind, "edit")) return {FieldType::Text, false};
  return {FieldType::Button, false};
}

std::string shortenFieldId(const std::string& name) {
  std::string cleaned = name;
  while (!cleaned.empty() && cleaned.front() == '/') cleaned.erase(cleaned.begin());
  while (!cleaned.empty() && cleaned.back() == '/') cleaned.pop_back();

  static const std::regex token("(?:^|[^a-z0-9])([a-z]\\d+[a-z0-9]*)", std::regex::icase);
  std::smatch m;
  if (std::regex_search(cleaned, m, token)) {
    std::string id = m[1].str();
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return id;
  }
  return cleaned;
}

ExtractionResult extractFormFields(const DecodedDocument& document, const ExtractorOptions& options) {
  validatePages(document);

  ExtractionResult result;
  result.metadata = document.metadata;

  std::map<std::string, int> seenIds;

  for (const DecodedPage& page : document.pages) {
    for (size_t i = 0; i < page.controls.size(); ++i) {
      const NativeControl& control = page.controls[i];

      FieldRecord record;
      record.pageNumber = page.pageNumber;
      record.pageOrder = static_cast<int>(i);
      record.rawType = control.kind;

      std::string name = control.name ? trim(*control.name) : std::string();
      if (!name.empty() && options.shortenFieldIds) name = shortenFieldId(name);

      std::vector<Diagnostic> pending;
      const std::string baseId = name.empty() ? fallbackFieldId(record.pageNumber, record.pageOrder) : name;
      record.fieldId = baseId;
      if (name.empty()) {
        pending.push_back(makeDiagnostic(DiagnosticKind::MissingFieldName, record,
                                         "control has no name; using generated id"));
      }
      auto seen = seenIds.find(baseId);
      if (seen != seenIds.end()) {
        std::string candidate;
        do {
          candidate = baseId + "#" + std::to_string(++seen->second);
        } while (seenIds.count(candidate));
        record.fieldId = candidate;
        pending.push_back(makeDiagnostic(DiagnosticKind::DuplicateFieldName, record,
                                         "id '" + baseId + "' already used; renamed to '" + candidate + "'"));
      }
      seenIds.emplace(record.fieldId, 1);

      FieldTypeMapping mapping = normalizeFieldType(control.kind, control.flags);
      record.fieldType = mapping.type;
      if (!mapping.known) {
        pending.push_back(makeDiagnostic(DiagnosticKind::UnknownFieldKind, record,
                                         "unrecognized kind '" + control.kind + "' treated as " + toString(mapping.type)));
      }

      if (!control.box) {
        pending.push_back(makeDiagnostic(DiagnosticKind::MissingBoundingBox, record,
                                         "control has no bounding box"));
      } else if (!isValidBox(*control.box)) {
        pending.push_back(makeDiagnostic(DiagnosticKind::InvalidBoundingBox, record,
                                         "control bounding box is not a finite, non-negative rectangle"));
      } else {
        record.position = control.box;
        record.nearText = findNearestLabel(*record.position, page.textSpans);
      }

      if ((record.fieldType == FieldType::Select || record.fieldType == FieldType::RadioButton) &&
          control.options) {
        record.valueOptions = control.options;
      }

      for (auto& d : pending) {
        d.fieldId = record.fieldId;
        result.diagnostics.push_back(std::move(d));
      }
      result.fields.push_back(std::move(record));
    }
  }

  if (result.fields.empty()) {
    result.noFormFields = NoFormFieldsError(document.metadata.pageCount);
  }

  return result;
}
