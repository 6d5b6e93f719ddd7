/// @file arrangement_panel.hpp
/// @brief Side panel listing ranked arrangements, the selected layout's metrics and DRC
/// results

#pragma once

#include "drc/drc_engine.hpp"
#include "model/arrangement.hpp"

#include <cstdint>
#include <vector>

namespace tapeboard {

/// Draws the ranked arrangement list with the selected entry highlighted, followed by its
/// metrics and routing summary.
/// @return Rendered panel height, for stacking panels below it.
float draw_arrangement_panel(const std::vector<Arrangement>& arrangements, int selected,
                             std::uint32_t seed, float panel_x, float panel_y, float panel_w);

/// Draws the DRC summary and the first violations that fit in `max_h`
/// @return Rendered panel height.
float draw_violation_panel(const std::vector<Violation>& violations, float panel_x, float panel_y,
                           float panel_w, float max_h);

} // namespace tapeboard
