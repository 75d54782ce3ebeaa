#include "config.hpp"
#include "diff_engine.hpp"
#include "extractor.hpp"
#include "pdf_decoder.hpp"
#include "report_json.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int printUsage(const char* argv0) {
  std::cerr
    << "usage:\n"
    << "  " << argv0 << " extract <pdf> [options]\n"
    << "  " << argv0 << " compare <source> <target> [options]\n"
    << "\n"
    << "compare inputs are PDFs or JSON files written by extract.\n"
    << "\n"
    << "options:\n"
    << "  --config=<file>          JSON config (extractor, decoder, diff sections)\n"
    << "  --out=<file>             write JSON here instead of stdout\n"
    << "  --granularity=line|word  text span granularity for labels (default: line)\n"
    << "  --shorten-ids            reduce hierarchical field names to their short code\n"
    << "  --tolerance=<f>          position tolerance per edge (default: 1.0)\n"
    << "  --normalize-labels       ignore case and whitespace when comparing labels\n"
    << "  --changes-only           omit unchanged fields from the change list\n"
    << "  --verbose                progress notes on stderr\n";
  return 2;
}

bool hasSuffix(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void reportDiagnostics(const std::string& input, const ExtractionResult& result) {
  for (const auto& d : result.diagnostics) {
    std::cerr << "Warning: " << input << ": page " << d.pageNumber << " #" << d.pageOrder
              << " (" << d.fieldId << "): " << d.message << "\n";
  }
}

ExtractionResult loadInput(const std::string& input, const AppConfig& config, bool verbose) {
  if (hasSuffix(input, ".json")) {
    if (verbose) std::cerr << "Loading saved extraction " << input << "\n";
    return loadExtraction(input);
  }
  if (verbose) std::cerr << "Decoding " << input << "\n";
  DecodedDocument document = decodePdf(input, config.decoder);
  ExtractionResult result = extractFormFields(document, config.extractor);
  if (verbose) {
    std::cerr << "Extracted " << result.fields.size() << " field(s) from "
              << result.metadata.pageCount << " page(s)\n";
  }
  reportDiagnostics(input, result);
  return result;
}

void emit(const nlohmann::json& j, const std::string& outPath) {
  if (outPath.empty()) {
    std::cout << j.dump(2) << "\n";
  } else {
    writeJson(j, outPath);
  }
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::vector<std::string> positional;
    std::string configPath;
    std::string outPath;
    std::string granularity;
    std::string tolerance;
    bool shortenIds = false;
    bool normalizeLabels = false;
    bool changesOnly = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.rfind("--config=", 0) == 0) {
        configPath = arg.substr(std::string("--config=").size());
      } else if (arg.rfind("--out=", 0) == 0) {
        outPath = arg.substr(std::string("--out=").size());
      } else if (arg.rfind("--granularity=", 0) == 0) {
        granularity = arg.substr(std::string("--granularity=").size());
      } else if (arg.rfind("--tolerance=", 0) == 0) {
        tolerance = arg.substr(std::string("--tolerance=").size());
      } else if (arg == "--shorten-ids") {
        shortenIds = true;
      } else if (arg == "--normalize-labels") {
        normalizeLabels = true;
      } else if (arg == "--changes-only") {
        changesOnly = true;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        return printUsage(argv[0]);
      } else {
        positional.push_back(arg);
      }
    }

    if (positional.empty()) return printUsage(argv[0]);

    AppConfig config;
    if (!configPath.empty()) config = loadConfigFile(configPath, config);
    if (!granularity.empty()) config.decoder.granularity = textGranularityFromString(granularity);
    if (!tolerance.empty()) config.diff.positionTolerance = parsePositionTolerance(tolerance);
    if (shortenIds) config.extractor.shortenFieldIds = true;
    if (normalizeLabels) config.diff.normalizeNearText = true;

    const std::string command = positional[0];
    const size_t expectedInputs = command == "extract" ? 1 : command == "compare" ? 2 : 0;
    if (expectedInputs == 0 || positional.size() != expectedInputs + 1) {
      return printUsage(argv[0]);
    }

    for (size_t i = 1; i < positional.size(); ++i) {
      if (!std::filesystem::exists(positional[i])) {
        std::cerr << "Input not found: " << positional[i] << "\n";
        return 2;
      }
    }

    if (command == "extract") {
      ExtractionResult result = loadInput(positional[1], config, verbose);
      emit(toJson(result), outPath);
      if (result.noFormFields) {
        std::cerr << "Warning: " << positional[1] << ": " << result.noFormFields->what() << "\n";
        return 3;
      }
      return 0;
    }

    ExtractionResult source = loadInput(positional[1], config, verbose);
    ExtractionResult target = loadInput(positional[2], config, verbose);
    ComparisonResult comparison = compareFields(source.fields, target.fields,
                                                source.metadata, target.metadata, config.diff);
    if (verbose) {
      const GlobalMetrics& m = comparison.globalMetrics;
      std::cerr << "Comparison: " << m.fieldsAdded << " added, " << m.fieldsRemoved << " removed, "
                << m.fieldsModified << " modified, " << m.fieldsUnchanged << " unchanged ("
                << m.modificationPercentage << "%)\n";
    }
    emit(toJson(comparison, changesOnly), outPath);
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
