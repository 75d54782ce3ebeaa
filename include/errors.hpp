#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// The input could not be read as a PDF, or the decoded pages contradict the
// document metadata.
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string& message,
                       std::optional<int> page = std::nullopt,
                       std::optional<long long> byteOffset = std::nullopt)
    : std::runtime_error(message), page_(page), byteOffset_(byteOffset) {}

  std::optional<int> page() const { return page_; }
  std::optional<long long> byteOffset() const { return byteOffset_; }

private:
  std::optional<int> page_;
  std::optional<long long> byteOffset_;
};

// A readable document without a single form control. Stored in the
// extraction result rather than thrown.
class NoFormFieldsError : public std::runtime_error {
public:
  explicit NoFormFieldsError(int pageCount)
    : std::runtime_error("document has no form fields (" + std::to_string(pageCount) + " page(s) scanned)"),
      pageCount_(pageCount) {}

  int pageCount() const { return pageCount_; }

private:
  int pageCount_;
};

// A field list handed to compareFields repeats a field id.
class DuplicateFieldIdError : public std::runtime_error {
public:
  DuplicateFieldIdError(const std::string& fieldId, const std::string& side)
    : std::runtime_error("duplicate field id '" + fieldId + "' in " + side + " fields"),
      fieldId_(fieldId), side_(side) {}

  const std::string& fieldId() const { return fieldId_; }
  const std::string& side() const { return side_; }

private:
  std::string fieldId_;
  std::string side_;
};
