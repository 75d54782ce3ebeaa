#pragma once

#include "diff_engine.hpp"
#include "extractor.hpp"
#include "pdf_decoder.hpp"

#include <string>

#include <nlohmann/json.hpp>

struct AppConfig {
  ExtractorOptions extractor;
  DecoderOptions decoder;
  DiffOptions diff;
};

// Overlays the recognized keys of `j` onto `base`. Unknown keys are ignored;
// a recognized key with the wrong type throws std::runtime_error.
AppConfig applyConfigJson(const nlohmann::json& j, AppConfig base = {});

AppConfig loadConfigFile(const std::string& path, AppConfig base = {});

// Parses a --tolerance value; rejects negative, non-finite and malformed input.
double parsePositionTolerance(const std::string& text);
