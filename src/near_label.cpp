#include "near_label.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>

namespace {

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

struct Candidate {
  double gap;
  double centerDistance;
  size_t index;

  bool betterThan(const Candidate& other) const {
    if (gap != other.gap) return gap < other.gap;
    if (centerDistance != other.centerDistance) return centerDistance < other.centerDistance;
    return index < other.index;
  }
};

double centerDistance(const BoundingBox& a, const BoundingBox& b) {
  double dx = a.centerX() - b.centerX();
  double dy = a.centerY() - b.centerY();
  return std::sqrt(dx * dx + dy * dy);
}

bool onSameLine(const BoundingBox& control, const BoundingBox& span) {
  if (std::abs(span.centerY() - control.centerY()) > control.height()) return false;
  return span.x0 <= control.x1;
}

bool strictlyAbove(const BoundingBox& control, const BoundingBox& span) {
  return span.y1 <= control.y0;
}

} // namespace

std::optional<std::string> findNearestLabel(const BoundingBox& control,
                                            const std::vector<TextSpan>& spans) {
  std::optional<Candidate> sameLine;
  std::optional<Candidate> above;

  for (size_t i = 0; i < spans.size(); ++i) {
    const TextSpan& span = spans[i];
    if (trim(span.text).empty() || !isValidBox(span.box)) continue;

    double dist = centerDistance(control, span.box);
    if (onSameLine(control, span.box)) {
      Candidate c{std::max(0.0, control.x0 - span.box.x1), dist, i};
      if (!sameLine || c.betterThan(*sameLine)) sameLine = c;
    } else if (strictlyAbove(control, span.box)) {
      Candidate c{control.y0 - span.box.y1, dist, i};
      if (!above || c.betterThan(*above)) above = c;
    }
  }

  if (sameLine) return trim(spans[sameLine->index].text);
  if (above) return trim(spans[above->index].text);
  return std::nullopt;
}
