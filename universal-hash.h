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

#ifndef TILECODING_UNIVERSAL_HASH_H
#define TILECODING_UNIVERSAL_HASH_H

#include <stdint.h>

#define TILECODING_MAX_NUM_COORDS 100     // maximum number of hashing coordinates

#define TILECODING_HASH_INCREMENT 449     // channel used for memory indexing
#define TILECODING_CHECK_INCREMENT 457    // independent channel for check hashes

namespace tilecoding {

/**
 * \brief Hash a tuple of integer coordinates into [0, m).
 *
 * Every byte of every coordinate selects a word of the seed table at an
 * address that depends on the byte value, the byte position, the
 * coordinate position and \p increment. The words of one coordinate are
 * summed and mixed into the running word, which is mixed again and reduced to [0, m) without modulo bias, so m need not be a
 * power of two.
 *
 * Different increments give independent hash channels over the same seed
 * table.
 *
 * \param coords coordinate tuple
 * \param num_coords number of coordinates, at most TILECODING_MAX_NUM_COORDS
 * \param m size of the target range, m >= 1
 * \param increment hash channel, TILECODING_HASH_INCREMENT for memory indexing
 * \return index in [0, m)
 */
int universal_hash (const int coords[], int num_coords, int m, int increment);

/**
 * \brief Hash a tuple into the full 32-bit range.
 *
 * The accumulated and mixed word that universal_hash() reduces to [0, m).
 */
uint32_t universal_hash32 (const int coords[], int num_coords, int increment);

/**
 * \brief Map a 32-bit hash onto [0, m) with multiply-shift and rejection.
 */
uint32_t reduce_range (uint32_t h, uint32_t m);

} // namespace tilecoding

#endif // TILECODING_UNIVERSAL_HASH_H
