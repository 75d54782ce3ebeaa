#include <catch2/catch_all.hpp>

#include "diff_engine.hpp"

#include <map>
#include <string>
#include <vector>

namespace {

BoundingBox box(double x0, double y0, double x1, double y1) {
  BoundingBox b;
  b.x0 = x0; b.y0 = y0; b.x1 = x1; b.y1 = y1;
  return b;
}

FieldRecord field(const std::string& id, FieldType type, int page, int order,
                  std::optional<std::string> nearText = std::nullopt) {
  FieldRecord f;
  f.fieldId = id;
  f.fieldType = type;
  f.rawType = "/Tx";
  f.pageNumber = page;
  f.pageOrder = order;
  f.nearText = std::move(nearText);
  f.position = box(100, 100.0 + order * 20, 200, 112.0 + order * 20);
  return f;
}

DocumentMetadata meta(int pages) {
  DocumentMetadata m;
  m.pageCount = pages;
  m.title = "Modelo 145";
  m.creationDate = "2024-01-10T09:00:00+01:00";
  return m;
}

std::vector<std::string> ids(const ComparisonResult& r) {
  std::vector<std::string> out;
  for (const auto& c : r.fieldChanges) out.push_back(c.fieldId);
  return out;
}

} // namespace

TEST_CASE("removed, added and modified fields are reported in priority order", "[diff]") {
  FieldRecord b = field("B", FieldType::RadioButton, 1, 1, "Resident");
  b.valueOptions = std::vector<std::string>{"Yes", "No"};
  std::vector<FieldRecord> source = {field("A", FieldType::Text, 1, 0, "Name"), b};
  std::vector<FieldRecord> target = {field("A", FieldType::Text, 1, 0, "Full name"),
                                     field("C", FieldType::Checkbox, 1, 1, "Agree")};

  ComparisonResult r = compareFields(source, target, meta(1), meta(1));

  REQUIRE(ids(r) == std::vector<std::string>{"B", "C", "A"});
  REQUIRE(r.fieldChanges[0].status == ChangeStatus::Removed);
  REQUIRE(r.fieldChanges[1].status == ChangeStatus::Added);
  REQUIRE(r.fieldChanges[2].status == ChangeStatus::Modified);

  const FieldChange& a = r.fieldChanges[2];
  REQUIRE(a.nearTextDiff == DiffStatus::Different);
  REQUIRE(a.valueOptionsDiff == DiffStatus::Equal);
  REQUIRE(a.positionChange == DiffStatus::Equal);
  REQUIRE(a.pageChange == DiffStatus::Equal);
  REQUIRE(a.sourceNearText == std::optional<std::string>("Name"));
  REQUIRE(a.targetNearText == std::optional<std::string>("Full name"));

  const FieldChange& removed = r.fieldChanges[0];
  REQUIRE(removed.nearTextDiff == DiffStatus::NotApplicable);
  REQUIRE(removed.sourceValueOptions == b.valueOptions);
  REQUIRE_FALSE(removed.targetPageNumber.has_value());

  const GlobalMetrics& m = r.globalMetrics;
  REQUIRE(m.modificationPercentage == Catch::Approx(100.0));
  REQUIRE(m.fieldsAdded == 1);
  REQUIRE(m.fieldsRemoved == 1);
  REQUIRE(m.fieldsModified == 1);
  REQUIRE(m.fieldsUnchanged == 0);
  REQUIRE(m.fieldCount.status == DiffStatus::Equal);
  REQUIRE(m.fieldCount.source == 2);
}

TEST_CASE("comparing a version with itself changes nothing", "[diff]") {
  FieldRecord radio = field("R1", FieldType::RadioButton, 2, 0);
  radio.valueOptions = std::vector<std::string>{"A", "B", "A"};
  FieldRecord loose = field("X", FieldType::Text, 2, 1);
  loose.position.reset();
  std::vector<FieldRecord> fields = {field("T1", FieldType::Text, 1, 0, "Name"), radio, loose};

  ComparisonResult r = compareFields(fields, fields, meta(2), meta(2));

  REQUIRE(r.globalMetrics.modificationPercentage == 0.0);
  REQUIRE(r.globalMetrics.fieldsUnchanged == 3);
  for (const auto& c : r.fieldChanges) {
    REQUIRE(c.status == ChangeStatus::Unchanged);
  }
  REQUIRE(r.globalMetrics.pageCount.status == DiffStatus::Equal);
  REQUIRE(r.globalMetrics.metadata.title.status == DiffStatus::Equal);
  REQUIRE(r.globalMetrics.metadata.author.status == DiffStatus::Equal);
}

TEST_CASE("option order is significant", "[diff]") {
  FieldRecord before = field("Q", FieldType::RadioButton, 1, 0, "Resident");
  before.valueOptions = std::vector<std::string>{"Yes", "No"};
  FieldRecord after = before;
  after.valueOptions = std::vector<std::string>{"No", "Yes"};

  ComparisonResult r = compareFields({before}, {after}, meta(1), meta(1));
  REQUIRE(r.fieldChanges.size() == 1);
  REQUIRE(r.fieldChanges[0].status == ChangeStatus::Modified);
  REQUIRE(r.fieldChanges[0].valueOptionsDiff == DiffStatus::Different);

  FieldRecord none = before;
  none.valueOptions.reset();
  ComparisonResult r2 = compareFields({before}, {none}, meta(1), meta(1));
  REQUIRE(r2.fieldChanges[0].valueOptionsDiff == DiffStatus::Different);
}

TEST_CASE("position drift within tolerance is not a change", "[diff]") {
  FieldRecord before = field("P", FieldType::Text, 1, 0);
  FieldRecord drift = before;
  drift.position = box(100.6, 100.0, 199.2, 113.0);
  FieldRecord moved = before;
  moved.position = box(100.0, 140.0, 200.0, 152.0);

  REQUIRE(compareFields({before}, {drift}, meta(1), meta(1)).fieldChanges[0].status == ChangeStatus::Unchanged);

  ComparisonResult r = compareFields({before}, {moved}, meta(1), meta(1));
  REQUIRE(r.fieldChanges[0].status == ChangeStatus::Modified);
  REQUIRE(r.fieldChanges[0].positionChange == DiffStatus::Different);

  DiffOptions loose;
  loose.positionTolerance = 50.0;
  REQUIRE(compareFields({before}, {moved}, meta(1), meta(1), loose).fieldChanges[0].status == ChangeStatus::Unchanged);

  REQUIRE(comparePositions(std::nullopt, std::nullopt, 1.0) == DiffStatus::Equal);
  REQUIRE(comparePositions(box(0, 0, 1, 1), std::nullopt, 1.0) == DiffStatus::Different);
}

TEST_CASE("a page move forces MODIFIED", "[diff]") {
  FieldRecord before = field("M", FieldType::Text, 1, 0, "Label");
  FieldRecord otherPage = before;
  otherPage.pageNumber = 2;
  ComparisonResult r = compareFields({before}, {otherPage}, meta(2), meta(2));
  REQUIRE(r.fieldChanges[0].status == ChangeStatus::Modified);
  REQUIRE(r.fieldChanges[0].pageChange == DiffStatus::Different);
  REQUIRE(r.fieldChanges[0].positionChange == DiffStatus::Equal);

}

TEST_CASE("a type-only change is reported but leaves the field UNCHANGED", "[diff]") {
  FieldRecord before = field("M", FieldType::Text, 1, 0, "Label");
  FieldRecord retyped = before;
  retyped.fieldType = FieldType::Checkbox;

  ComparisonResult r = compareFields({before}, {retyped}, meta(1), meta(1));
  REQUIRE(r.fieldChanges.size() == 1);
  REQUIRE(r.fieldChanges[0].status == ChangeStatus::Unchanged);
  REQUIRE(r.fieldChanges[0].fieldTypeChange == DiffStatus::Different);
  REQUIRE(r.fieldChanges[0].sourceFieldType == FieldType::Text);
  REQUIRE(r.fieldChanges[0].targetFieldType == FieldType::Checkbox);
  REQUIRE(r.globalMetrics.fieldsModified == 0);
  REQUIRE(r.globalMetrics.fieldsUnchanged == 1);
  REQUIRE(r.globalMetrics.modificationPercentage == 0.0);
}

TEST_CASE("label normalization is opt-in", "[diff]") {
  FieldRecord before = field("L", FieldType::Text, 1, 0, "Full  name ");
  FieldRecord after = field("L", FieldType::Text, 1, 0, "full name");

  REQUIRE(compareFields({before}, {after}, meta(1), meta(1)).fieldChanges[0].nearTextDiff == DiffStatus::Different);

  DiffOptions options;
  options.normalizeNearText = true;
  REQUIRE(compareFields({before}, {after}, meta(1), meta(1), options).fieldChanges[0].nearTextDiff == DiffStatus::Equal);
}

TEST_CASE("duplicate field ids are rejected", "[diff]") {
  std::vector<FieldRecord> dup = {field("D", FieldType::Text, 1, 0), field("D", FieldType::Text, 1, 1)};
  std::vector<FieldRecord> ok = {field("D", FieldType::Text, 1, 0)};

  REQUIRE_THROWS_AS(compareFields(dup, ok, meta(1), meta(1)), DuplicateFieldIdError);
  try {
    compareFields(ok, dup, meta(1), meta(1));
    FAIL("expected DuplicateFieldIdError");
  } catch (const DuplicateFieldIdError& e) {
    REQUIRE(e.fieldId() == "D");
    REQUIRE(e.side() == "target");
  }
}

TEST_CASE("empty inputs yield zero percent", "[diff]") {
  ComparisonResult r = compareFields({}, {}, meta(1), meta(3));
  REQUIRE(r.fieldChanges.empty());
  REQUIRE(r.globalMetrics.modificationPercentage == 0.0);
  REQUIRE(r.globalMetrics.pageCount.status == DiffStatus::Different);
  REQUIRE(r.globalMetrics.pageCount.source == 1);
  REQUIRE(r.globalMetrics.pageCount.target == 3);
}

TEST_CASE("metadata fields are compared one by one", "[diff]") {
  DocumentMetadata source = meta(1);
  DocumentMetadata target = meta(1);
  target.modificationDate = "2024-03-01T12:00:00+01:00";
  target.author = "SEPE";

  ComparisonResult r = compareFields({}, {}, source, target);
  const MetadataDiff& md = r.globalMetrics.metadata;
  REQUIRE(md.title.status == DiffStatus::Equal);
  REQUIRE(md.subject.status == DiffStatus::Equal);
  REQUIRE(md.creationDate.status == DiffStatus::Equal);
  REQUIRE(md.modificationDate.status == DiffStatus::Different);
  REQUIRE(md.author.status == DiffStatus::Different);
  REQUIRE_FALSE(md.author.source.has_value());
}

TEST_CASE("field changes cover the id universe once and follow page order", "[diff]") {
  std::vector<FieldRecord> source = {
    field("S1", FieldType::Text, 1, 0),
    field("K1", FieldType::Text, 1, 1),
    field("S2", FieldType::Text, 2, 0),
    field("K2", FieldType::Text, 2, 1, "changed?"),
    field("K3", FieldType::Text, 3, 0),
  };
  std::vector<FieldRecord> target = {
    field("N1", FieldType::Text, 1, 0),
    field("K1", FieldType::Text, 1, 1),
    field("K2", FieldType::Text, 2, 0, "changed!"),
    field("K3", FieldType::Text, 3, 0),
    field("N0", FieldType::Text, 3, 1),
  };

  ComparisonResult r = compareFields(source, target, meta(3), meta(3));

  REQUIRE(ids(r) == std::vector<std::string>{"S1", "S2", "N1", "N0", "K2", "K1", "K3"});

  std::map<std::string, int> seen;
  for (const auto& c : r.fieldChanges) seen[c.fieldId]++;
  REQUIRE(seen.size() == 7);
  for (const auto& kv : seen) REQUIRE(kv.second == 1);

  const GlobalMetrics& m = r.globalMetrics;
  REQUIRE(m.fieldsAdded - m.fieldsRemoved ==
          static_cast<int>(target.size()) - static_cast<int>(source.size()));
  REQUIRE(m.modificationPercentage == Catch::Approx(5.0 / 7.0 * 100.0));
}
