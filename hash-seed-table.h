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

#ifndef TILECODING_HASH_SEED_TABLE_H
#define TILECODING_HASH_SEED_TABLE_H

#include <array>
#include <stdint.h>

#define TILECODING_SEED_TABLE_SIZE 2048
#define TILECODING_SEED_TABLE_MASK (TILECODING_SEED_TABLE_SIZE - 1)

namespace tilecoding {

namespace detail {

/*
 * Table of random words used by the universal hash. Generated at compile
 * time by a fixed linear congruential generator so every process (and
 * every simulation run) hashes identically.
 *
 * The low bits of a power-of-two LCG have short periods, so each byte is
 * taken from bits 16..23 of the state.
 */
constexpr std::array<uint32_t, TILECODING_SEED_TABLE_SIZE>
MakeHashSeedTable (uint32_t seed)
{
  std::array<uint32_t, TILECODING_SEED_TABLE_SIZE> table {};
  for (int k = 0; k < TILECODING_SEED_TABLE_SIZE; k++)
    {
      uint32_t word = 0;
      for (int i = 0; i < 4; ++i)
        {
          seed = (1103515245u * seed + 12345u) & 0x7fffffffu;
          word = (word << 8) | ((seed >> 16) & 0xffu);
        }
      table[k] = word;
    }
  return table;
}

} // namespace detail

constexpr std::array<uint32_t, TILECODING_SEED_TABLE_SIZE> g_hashSeedTable =
  detail::MakeHashSeedTable (123);

} // namespace tilecoding

#endif // TILECODING_HASH_SEED_TABLE_H
