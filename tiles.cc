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

/*
 * Grid-style tile codings after the UNH CMAC code
 * (http://www.ece.unh.edu/robots/cmac.htm), as popularized by R. Sutton's
 * tile coding software (http://www.cs.umass.edu/~rich/tiles.html).
 * The procedure is memoryless and requires no setup.
 */

#include <cmath>
#include <limits>
#include <numeric>
#include "ns3/abort.h"
#include "ns3/log.h"
#include "tiles.h"

using namespace ns3;

NS_LOG_COMPONENT_DEFINE ("TileCoding");

namespace tilecoding {

void
quantize_state (int qstate[], const double floats[], int num_floats, int num_tilings)
{
  /* keep room below the minimum for the displacement of any tiling */
  const double lowest = static_cast<double> (std::numeric_limits<int>::min ()) + num_tilings;
  const double highest = static_cast<double> (std::numeric_limits<int>::max ());

  for (int i = 0; i < num_floats; i++)
    {
      NS_ABORT_MSG_IF (std::isnan (floats[i]), "tiles: float variable " << i << " is NaN");
      double q = std::floor (floats[i] * num_tilings);
      if (q < lowest)
        {
          q = lowest;
        }
      else if (q > highest)
        {
          q = highest;
        }
      qstate[i] = static_cast<int> (q);
    }
}

void
tiling_multipliers (int multipliers[], int num_floats, int num_tilings)
{
  /* odd numbers sharing a factor with num_tilings would repeat displacements */
  int k = 1;
  for (int i = 0; i < num_floats; i++, k += 2)
    {
      while (std::gcd (k, num_tilings) != 1)
        {
          k += 2;
        }
      multipliers[i] = k;
    }
}

void
tiling_coordinates (int coordinates[], const int qstate[], const int multipliers[],
                    int num_floats, int tiling, int num_tilings)
{
  for (int i = 0; i < num_floats; i++)
    {
      /* displacement of this tiling in quantized space */
      int64_t base = (static_cast<int64_t> (tiling) * multipliers[i]) % num_tilings;

      /* find coordinates of activated tile in tiling space */
      int64_t shift = (static_cast<int64_t> (qstate[i]) - base) % num_tilings;
      if (shift < 0)
        {
          shift += num_tilings;
        }
      coordinates[i] = static_cast<int> (qstate[i] - shift);
    }
}

void
tiles (int the_tiles[],
       int num_tilings,
       int memory_size,
       const double floats[],
       int num_floats,
       const int ints[],
       int num_ints)
{
  NS_LOG_FUNCTION (num_tilings << memory_size << num_floats << num_ints);
  NS_ABORT_MSG_IF (num_tilings <= 0, "tiles: num_tilings must be positive, got " << num_tilings);
  NS_ABORT_MSG_IF (memory_size <= 0, "tiles: memory_size must be positive, got " << memory_size);
  NS_ABORT_MSG_IF (num_floats < 0 || num_floats > TILECODING_MAX_NUM_VARS,
                   "tiles: " << num_floats << " float variables, expected 0.."
                   << TILECODING_MAX_NUM_VARS);
  NS_ABORT_MSG_IF (num_ints < 0, "tiles: negative number of int variables");
  NS_ABORT_MSG_IF (num_floats + num_ints + 1 > TILECODING_MAX_NUM_COORDS,
                   "tiles: " << num_floats + num_ints + 1 << " coordinates exceed "
                   << TILECODING_MAX_NUM_COORDS);

  int qstate[TILECODING_MAX_NUM_VARS];
  int multipliers[TILECODING_MAX_NUM_VARS];
  int coordinates[TILECODING_MAX_NUM_COORDS];   /* one interval number per relevant dimension */
  int num_coordinates = num_floats + num_ints + 1;

  for (int i = 0; i < num_ints; i++)
    {
      coordinates[num_floats + 1 + i] = ints[i];
    }

  /* quantize state to integers (henceforth, tile widths == num_tilings) */
  quantize_state (qstate, floats, num_floats, num_tilings);
  tiling_multipliers (multipliers, num_floats, num_tilings);

  /* compute the tile numbers */
  for (int j = 0; j < num_tilings; j++)
    {
      tiling_coordinates (coordinates, qstate, multipliers, num_floats, j, num_tilings);

      /* the tiling index makes identical cells of different tilings hash differently */
      coordinates[num_floats] = j;

      the_tiles[j] = universal_hash (coordinates, num_coordinates, memory_size,
                                     TILECODING_HASH_INCREMENT);
      NS_LOG_DEBUG ("tiling " << j << " -> tile " << the_tiles[j]);
    }
}

std::vector<int>
tiles (int num_tilings,
       int memory_size,
       const std::vector<double> &floats,
       const std::vector<int> &ints)
{
  NS_ABORT_MSG_IF (num_tilings <= 0, "tiles: num_tilings must be positive, got " << num_tilings);
  std::vector<int> the_tiles (num_tilings);
  tiles (the_tiles.data (), num_tilings, memory_size,
         floats.data (), static_cast<int> (floats.size ()),
         ints.data (), static_cast<int> (ints.size ()));
  return the_tiles;
}

} // namespace tilecoding
