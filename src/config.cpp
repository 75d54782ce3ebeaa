#include "config.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const json* section(const json& j, const char* key) {
  if (!j.contains(key)) return nullptr;
  const json& s = j.at(key);
  if (!s.is_object()) {
    throw std::runtime_error(std::string(key) + " must be an object");
  }
  return &s;
}

void readBool(const json& s, const char* key, const std::string& where, bool& out) {
  if (!s.contains(key)) return;
  if (!s.at(key).is_boolean()) {
    throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
  }
  out = s.at(key).get<bool>();
}

bool isValidTolerance(double v) {
  return std::isfinite(v) && v >= 0.0;
}

void readTolerance(const json& s, const char* key, const std::string& where, double& out) {
  if (!s.contains(key)) return;
  const json& v = s.at(key);
  if (!v.is_number() || !isValidTolerance(v.get<double>())) {
    throw std::runtime_error(where + "." + std::string(key) + " must be a non-negative number");
  }
  out = v.get<double>();
}

} // namespace

AppConfig applyConfigJson(const json& j, AppConfig base) {
  if (!j.is_object()) {
    throw std::runtime_error("config must be an object");
  }

  if (const json* s = section(j, "extractor")) {
    readBool(*s, "shorten_field_ids", "extractor", base.extractor.shortenFieldIds);
  }

  if (const json* s = section(j, "decoder")) {
    if (s->contains("granularity")) {
      const json& g = s->at("granularity");
      if (!g.is_string()) {
        throw std::runtime_error("decoder.granularity must be a string");
      }
      base.decoder.granularity = textGranularityFromString(g.get<std::string>());
    }
  }

  if (const json* s = section(j, "diff")) {
    readTolerance(*s, "position_tolerance", "diff", base.diff.positionTolerance);
    readBool(*s, "normalize_near_text", "diff", base.diff.normalizeNearText);
  }

  return base;
}

AppConfig loadConfigFile(const std::string& path, AppConfig base) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open config file " + path);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("config file " + path + " is not valid JSON");
  return applyConfigJson(j, base);
}

double parsePositionTolerance(const std::string& text) {
  char* endp = nullptr;
  const double v = std::strtod(text.c_str(), &endp);
  if (text.empty() || *endp != '\0' || !isValidTolerance(v)) {
    throw std::runtime_error("--tolerance expects a non-negative number, got '" + text + "'");
  }
  return v;
}
