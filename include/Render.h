#pragma once

#include <iostream>
#include <vector>

#include "BeliefMap.h"
#include "GridTypes.h"
#include "GridWorld.h"

namespace AIF {

/**
 * @brief Draw the belief as an ASCII heatmap with the path overlaid.
 *
 * Free cells are shaded by their mass relative to the largest entry. Markers
 * take precedence in the order agent 'A', goal 'G', obstacle '#', visited
 * cell '*'.
 */
void RenderBelief(std::ostream& os, const BeliefMap& belief,
                  const std::vector<Position>& history,
                  const Position& position, const Position& goal,
                  const std::vector<Position>& obstacles);

/// @brief One line per grid row of comma separated masses
void WriteBeliefCSV(std::ostream& os, const BeliefMap& belief);

/// @brief "step,row,col" header followed by one line per history entry
void WriteHistoryCSV(std::ostream& os, const std::vector<Position>& history);

}  // namespace AIF
