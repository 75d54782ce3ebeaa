#pragma once

#include "diff_engine.hpp"
#include "extractor.hpp"

#include <string>

#include <nlohmann/json.hpp>

nlohmann::json toJson(const ExtractionResult& result);

// Reads back a saved extraction. Throws std::runtime_error naming the
// offending path when the document does not have the expected shape.
ExtractionResult extractionFromJson(const nlohmann::json& j);

// `changesOnly` drops unchanged fields from field_changes; metrics still
// cover every field.
nlohmann::json toJson(const ComparisonResult& result, bool changesOnly = false);

ExtractionResult loadExtraction(const std::string& path);
void writeJson(const nlohmann::json& j, const std::string& path);
