#pragma once

#include "form_model.hpp"

#include <optional>
#include <string>
#include <vector>

// One widget as the decoder saw it. Anything may be missing; the extractor
// decides what a missing attribute means.
struct NativeControl {
  std::optional<std::string> name;
  std::string kind;                  // e.g. "/Tx", "/Btn", "combobox"
  int flags = 0;                     // AcroForm /Ff bits, 0 when unknown
  std::optional<BoundingBox> box;
  std::optional<std::vector<std::string>> options;
};

struct DecodedPage {
  int pageNumber = 0;
  double width = 0.0;
  double height = 0.0;
  std::vector<TextSpan> textSpans;    // document order
  std::vector<NativeControl> controls; // decoder emission order
};

struct DecodedDocument {
  DocumentMetadata metadata;
  std::vector<DecodedPage> pages;
};
