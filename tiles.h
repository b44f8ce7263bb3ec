/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation;
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#ifndef TILECODING_TILES_H
#define TILECODING_TILES_H

#include <vector>
#include "universal-hash.h"

#define TILECODING_MAX_NUM_VARS 20        // maximum number of variables in a grid-tiling

namespace tilecoding {

/*
 * Grid-style tile coding.
 *
 * Floating-point inputs are gridded at unit intervals: any scaling (tile
 * width per dimension) is done by the caller before calling tiles(). There
 * is no generalization across integer inputs. Collisions in memory are
 * ignored, so duplicates in the returned list are possible but unlikely
 * when memory_size is large.
 */

/**
 * \brief Quantize a state into units of 1/num_tilings of a tile.
 *
 * qstate[i] = floor(floats[i] * num_tilings), saturated to the int range.
 */
void quantize_state (int qstate[], const double floats[], int num_floats, int num_tilings);

/**
 * \brief Displacement step of every dimension.
 *
 * multipliers[i] is the i-th odd number coprime to num_tilings, so the
 * tilings visit every displacement in every dimension.
 */
void tiling_multipliers (int multipliers[], int num_floats, int num_tilings);

/**
 * \brief Coordinates of the active tile of one tiling.
 *
 * Tiling j is displaced by j * multipliers[i] quantization steps (modulo
 * num_tilings) along dimension i, so each tiling is shifted by a different
 * fraction of a tile in every dimension. Writes num_floats coordinates.
 */
void tiling_coordinates (int coordinates[], const int qstate[], const int multipliers[],
                         int num_floats, int tiling, int num_tilings);

/**
 * \brief Map float and int variables to one tile index per tiling.
 *
 * \param the_tiles provided array receiving num_tilings tile indices
 * \param num_tilings number of tile indices to be returned in the_tiles
 * \param memory_size total number of possible tiles
 * \param floats array of floating point variables
 * \param num_floats number of floating point variables
 * \param ints array of integer variables
 * \param num_ints number of integer variables
 */
void tiles (int the_tiles[],
            int num_tilings,
            int memory_size,
            const double floats[],
            int num_floats,
            const int ints[],
            int num_ints);

std::vector<int> tiles (int num_tilings,
                        int memory_size,
                        const std::vector<double> &floats,
                        const std::vector<int> &ints = std::vector<int> ());

} // namespace tilecoding

#endif // TILECODING_TILES_H
