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

#include "ns3/abort.h"
#include "ns3/log.h"
#include "hash-seed-table.h"
#include "universal-hash.h"

using namespace ns3;

NS_LOG_COMPONENT_DEFINE ("UniversalHash");

namespace tilecoding {

namespace {

/* murmur3 finalizer */
inline uint32_t
MixWord (uint32_t h)
{
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

} // anonymous namespace

uint32_t
universal_hash32 (const int coords[], int num_coords, int increment)
{
  NS_ABORT_MSG_IF (num_coords < 0 || num_coords > TILECODING_MAX_NUM_COORDS,
                   "universal_hash: " << num_coords << " coordinates, expected 0.."
                   << TILECODING_MAX_NUM_COORDS);

  uint32_t sum = 0;
  for (int i = 0; i < num_coords; i++)
    {
      uint32_t value = static_cast<uint32_t> (coords[i]);
      /* random table offset for this dimension, wrapped around the table */
      uint32_t offset = static_cast<uint32_t> (increment) * static_cast<uint32_t> (i + 1);
      uint32_t element = 0;
      for (uint32_t k = 0; k < 4; k++, value >>= 8)
        {
          uint32_t index = ((value & 0xffu) + (k << 8) + offset) & TILECODING_SEED_TABLE_MASK;
          element += g_hashSeedTable[index];
        }
      /* windows of neighbouring elements overlap, so mix before the next one */
      sum = MixWord (sum + element);
    }
  return MixWord (sum);
}

uint32_t
reduce_range (uint32_t h, uint32_t m)
{
  NS_ABORT_MSG_IF (m == 0, "reduce_range: empty range");

  uint64_t product = static_cast<uint64_t> (h) * m;
  uint32_t low = static_cast<uint32_t> (product);
  if (low < m)
    {
      /* values below 2^32 mod m would over-represent the low buckets */
      uint32_t threshold = (0u - m) % m;
      while (low < threshold)
        {
          h = MixWord (h + 0x9e3779b9u);
          product = static_cast<uint64_t> (h) * m;
          low = static_cast<uint32_t> (product);
        }
    }
  return static_cast<uint32_t> (product >> 32);
}

int
universal_hash (const int coords[], int num_coords, int m, int increment)
{
  NS_ABORT_MSG_IF (m <= 0, "universal_hash: memory size must be positive, got " << m);

  uint32_t h = universal_hash32 (coords, num_coords, increment);
  int index = static_cast<int> (reduce_range (h, static_cast<uint32_t> (m)));
  NS_LOG_LOGIC ("hash of " << num_coords << " coordinates (increment " << increment
                << ") -> " << index << " of " << m);
  return index;
}

} // namespace tilecoding
