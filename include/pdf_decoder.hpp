#pragma once

#include "decoded_document.hpp"

#include <map>
#include <string>
#include <vector>

enum class TextGranularity { Line, Word };

std::string toString(TextGranularity granularity);
TextGranularity textGranularityFromString(const std::string& name);

struct DecoderOptions {
  TextGranularity granularity = TextGranularity::Line;
};

// Decodes a PDF with the poppler-utils and qpdf command line tools.
// Text spans and control boxes share one space: top-left origin, y down.
// Throws DecodeError for files that are not readable PDFs and
// std::runtime_error when a required tool is not installed.
DecodedDocument decodePdf(const std::string& pdfPath, const DecoderOptions& options = {});

// Parses `pdfinfo -isodates` output.
DocumentMetadata parsePdfInfo(const std::string& output);

// Parses `pdftotext -bbox-layout` output into pages carrying text spans.
std::vector<DecodedPage> parseBboxLayout(const std::string& xhtml, TextGranularity granularity);

// Parses `qpdf --json=2 --json-key=acroform --json-key=qpdf` output into the
// controls of each page, keyed by page number. Widgets sharing a fully
// qualified name are merged. `pages` supplies the heights used to flip
// PDF rectangles into top-left space.
std::map<int, std::vector<NativeControl>> parseQpdfAcroform(const std::string& json,
                                                            const std::vector<DecodedPage>& pages);
