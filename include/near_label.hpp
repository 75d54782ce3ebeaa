#pragma once

#include "form_model.hpp"

#include <optional>
#include <string>
#include <vector>

// Picks the text that most likely captions the control at `control`.
//
// Spans on the same line (vertical center within one control height of the
// control's center) that start left of the control's right edge win, ranked
// by horizontal gap. Failing that, the span with the smallest gap strictly
// above the control is used. Ties go to the smaller center-to-center distance
// and then to the earlier span. Blank spans never match.
//
// `spans` must already be restricted to the control's page.
std::optional<std::string> findNearestLabel(const BoundingBox& control,
                                            const std::vector<TextSpan>& spans);
