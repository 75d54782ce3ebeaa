#include "report_json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
json optionalJson(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

json boxJson(const std::optional<BoundingBox>& box) {
  if (!box) return nullptr;
  return json{{"x0", box->x0}, {"y0", box->y0}, {"x1", box->x1}, {"y1", box->y1}};
}

json fieldTypeJson(const std::optional<FieldType>& type) {
  return type ? json(toString(*type)) : json(nullptr);
}

template <typename T>
json pairJson(const ValuePair<T>& p) {
  return json{{"source", p.source}, {"target", p.target}, {"status", toString(p.status)}};
}

json pairJson(const ValuePair<std::optional<std::string>>& p) {
  return json{{"source", optionalJson(p.source)}, {"target", optionalJson(p.target)}, {"status", toString(p.status)}};
}

void requireObject(const json& j, const std::string& where) {
  if (!j.is_object()) {
    throw std::runtime_error(where + " must be an object");
  }
}

const json& requireMember(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key)) {
    throw std::runtime_error(where + " missing required field: " + std::string(key));
  }
  return j.at(key);
}

std::string requireString(const json& j, const char* key, const std::string& where) {
  const json& v = requireMember(j, key, where);
  if (!v.is_string()) {
    throw std::runtime_error(where + "." + std::string(key) + " must be a string");
  }
  return v.get<std::string>();
}

int requireInt(const json& j, const char* key, const std::string& where) {
  const json& v = requireMember(j, key, where);
  if (!v.is_number_integer()) {
    throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
  }
  return v.get<int>();
}

std::optional<std::string> optionalString(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  if (!j.at(key).is_string()) {
    throw std::runtime_error(where + "." + std::string(key) + " must be a string or null");
  }
  return j.at(key).get<std::string>();
}

std::optional<std::vector<std::string>> optionalStringArray(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  const json& arr = j.at(key);
  if (!arr.is_array()) {
    throw std::runtime_error(where + "." + std::string(key) + " must be an array or null");
  }
  std::vector<std::string> out;
  out.reserve(arr.size());
  for (size_t i = 0; i < arr.size(); ++i) {
    if (!arr.at(i).is_string()) {
      std::ostringstream oss;
      oss << where << "." << key << "[" << i << "] must be a string";
      throw std::runtime_error(oss.str());
    }
    out.push_back(arr.at(i).get<std::string>());
  }
  return out;
}

std::optional<BoundingBox> optionalBox(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  const json& b = j.at(key);
  const std::string path = where + "." + key;
  requireObject(b, path);
  BoundingBox box;
  double* edges[4] = {&box.x0, &box.y0, &box.x1, &box.y1};
  const char* names[4] = {"x0", "y0", "x1", "y1"};
  for (int i = 0; i < 4; ++i) {
    const json& v = requireMember(b, names[i], path);
    if (!v.is_number()) {
      throw std::runtime_error(path + "." + names[i] + " must be a number");
    }
    *edges[i] = v.get<double>();
  }
  return box;
}

FieldRecord parseField(const json& j, const std::string& where) {
  requireObject(j, where);

  FieldRecord f;
  f.fieldId = requireString(j, "field_id", where);
  try {
    f.fieldType = fieldTypeFromString(requireString(j, "field_type", where));
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(where + ".field_type: " + e.what());
  }
  f.rawType = requireString(j, "raw_type", where);
  f.pageNumber = requireInt(j, "page_number", where);
  f.pageOrder = requireInt(j, "page_order", where);
  f.nearText = optionalString(j, "near_text", where);
  f.valueOptions = optionalStringArray(j, "value_options", where);
  f.position = optionalBox(j, "position", where);
  return f;
}

Diagnostic parseDiagnostic(const json& j, const std::string& where) {
  requireObject(j, where);

  Diagnostic d;
  try {
    d.kind = diagnosticKindFromString(requireString(j, "kind", where));
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(where + ".kind: " + e.what());
  }
  d.pageNumber = requireInt(j, "page_number", where);
  d.pageOrder = requireInt(j, "page_order", where);
  d.fieldId = requireString(j, "field_id", where);
  d.message = requireString(j, "message", where);
  return d;
}

json changeJson(const FieldChange& c) {
  return json{
    {"field_id", c.fieldId},
    {"status", toString(c.status)},
    {"field_type", toString(c.fieldType)},
    {"raw_type", c.rawType},
    {"source_page_number", optionalJson(c.sourcePageNumber)},
    {"target_page_number", optionalJson(c.targetPageNumber)},
    {"source_page_order", optionalJson(c.sourcePageOrder)},
    {"target_page_order", optionalJson(c.targetPageOrder)},
    {"page_change", toString(c.pageChange)},
    {"field_type_change", toString(c.fieldTypeChange)},
    {"source_field_type", fieldTypeJson(c.sourceFieldType)},
    {"target_field_type", fieldTypeJson(c.targetFieldType)},
    {"near_text_diff", toString(c.nearTextDiff)},
    {"source_near_text", optionalJson(c.sourceNearText)},
    {"target_near_text", optionalJson(c.targetNearText)},
    {"value_options_diff", toString(c.valueOptionsDiff)},
    {"source_value_options", optionalJson(c.sourceValueOptions)},
    {"target_value_options", optionalJson(c.targetValueOptions)},
    {"position_change", toString(c.positionChange)},
    {"source_position", boxJson(c.sourcePosition)},
    {"target_position", boxJson(c.targetPosition)},
  };
}

} // namespace

json toJson(const ExtractionResult& result) {
  const DocumentMetadata& m = result.metadata;
  json j;
  j["metadata"] = json{
    {"title", optionalJson(m.title)},
    {"author", optionalJson(m.author)},
    {"subject", optionalJson(m.subject)},
    {"creation_date", optionalJson(m.creationDate)},
    {"modification_date", optionalJson(m.modificationDate)},
    {"page_count", m.pageCount},
  };

  json fields = json::array();
  for (const auto& f : result.fields) {
    fields.push_back(json{
      {"field_id", f.fieldId},
      {"field_type", toString(f.fieldType)},
      {"raw_type", f.rawType},
      {"page_number", f.pageNumber},
      {"page_order", f.pageOrder},
      {"near_text", optionalJson(f.nearText)},
      {"value_options", optionalJson(f.valueOptions)},
      {"position", boxJson(f.position)},
    });
  }
  j["fields"] = std::move(fields);

  json diagnostics = json::array();
  for (const auto& d : result.diagnostics) {
    diagnostics.push_back(json{
      {"kind", toString(d.kind)},
      {"page_number", d.pageNumber},
      {"page_order", d.pageOrder},
      {"field_id", d.fieldId},
      {"message", d.message},
    });
  }
  j["diagnostics"] = std::move(diagnostics);
  j["no_form_fields"] = result.noFormFields.has_value();
  return j;
}

ExtractionResult extractionFromJson(const json& j) {
  requireObject(j, "extraction");

  ExtractionResult result;
  const json& meta = requireMember(j, "metadata", "extraction");
  requireObject(meta, "extraction.metadata");
  result.metadata.title = optionalString(meta, "title", "extraction.metadata");
  result.metadata.author = optionalString(meta, "author", "extraction.metadata");
  result.metadata.subject = optionalString(meta, "subject", "extraction.metadata");
  result.metadata.creationDate = optionalString(meta, "creation_date", "extraction.metadata");
  result.metadata.modificationDate = optionalString(meta, "modification_date", "extraction.metadata");
  result.metadata.pageCount = requireInt(meta, "page_count", "extraction.metadata");

  const json& fields = requireMember(j, "fields", "extraction");
  if (!fields.is_array()) throw std::runtime_error("extraction.fields must be an array");
  for (size_t i = 0; i < fields.size(); ++i) {
    result.fields.push_back(parseField(fields.at(i), "extraction.fields[" + std::to_string(i) + "]"));
  }

  if (j.contains("diagnostics")) {
    const json& diags = j.at("diagnostics");
    if (!diags.is_array()) throw std::runtime_error("extraction.diagnostics must be an array");
    for (size_t i = 0; i < diags.size(); ++i) {
      result.diagnostics.push_back(parseDiagnostic(diags.at(i), "extraction.diagnostics[" + std::to_string(i) + "]"));
    }
  }

  if (result.fields.empty()) {
    result.noFormFields = NoFormFieldsError(result.metadata.pageCount);
  }
  return result;
}

json toJson(const ComparisonResult& result, bool changesOnly) {
  const GlobalMetrics& m = result.globalMetrics;
  json j;
  j["global_metrics"] = json{
    {"page_count", pairJson(m.pageCount)},
    {"field_count", pairJson(m.fieldCount)},
    {"metadata", json{
      {"title", pairJson(m.metadata.title)},
      {"author", pairJson(m.metadata.author)},
      {"subject", pairJson(m.metadata.subject)},
      {"creation_date", pairJson(m.metadata.creationDate)},
      {"modification_date", pairJson(m.metadata.modificationDate)},
    }},
    {"fields_added", m.fieldsAdded},
    {"fields_removed", m.fieldsRemoved},
    {"fields_modified", m.fieldsModified},
    {"fields_unchanged", m.fieldsUnchanged},
    {"modification_percentage", m.modificationPercentage},
  };

  json changes = json::array();
  for (const auto& c : result.fieldChanges) {
    if (changesOnly && c.status == ChangeStatus::Unchanged) continue;
    changes.push_back(changeJson(c));
  }
  j["field_changes"] = std::move(changes);
  return j;
}

ExtractionResult loadExtraction(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open " + path);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error(path + " is not valid JSON");
  return extractionFromJson(j);
}

void writeJson(const json& j, const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << j.dump(2) << "\n";
}
