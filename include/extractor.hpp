#pragma once

#include "decoded_document.hpp"
#include "errors.hpp"
#include "form_model.hpp"

#include <optional>
#include <string>
#include <vector>

struct ExtractorOptions {
  // Reduce "form1[0].#subform[0].A0101[0]" style names to "A0101".
  bool shortenFieldIds = false;
};

struct ExtractionResult {
  std::vector<FieldRecord> fields;      // (pageNumber, pageOrder) ascending
  DocumentMetadata metadata;
  std::vector<Diagnostic> diagnostics;
  std::optional<NoFormFieldsError> noFormFields;
};

struct FieldTypeMapping {
  FieldType type;
  bool known;   // false when the kind fell through to the closest bucket
};

// Maps a native control kind (AcroForm /FT name or a decoder's own spelling)
// plus its /Ff flags to a FieldType. Never fails.
FieldTypeMapping normalizeFieldType(const std::string& nativeKind, int flags);

// First "letter digits [alnum]*" token that starts a segment of a
// hierarchical name, upper-cased.
// Returns the name without surrounding slashes when no token matches.
std::string shortenFieldId(const std::string& name);

// Builds the ordered field records of a decoded document.
// Throws DecodeError when the page list contradicts the metadata.
ExtractionResult extractFormFields(const DecodedDocument& document,
                                   const ExtractorOptions& options = {});
