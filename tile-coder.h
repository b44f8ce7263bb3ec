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

#ifndef TILECODING_TILE_CODER_H
#define TILECODING_TILE_CODER_H

#include <vector>
#include "ns3/object.h"
#include "ns3/ptr.h"
#include "tiles.h"

namespace tilecoding {

/**
 * \brief Hashed tile coding of a continuous state into a sparse binary
 * feature vector of MemorySize entries.
 *
 * The caller scales every state variable by its tile width before use.
 * When UseIntOffset is set, IntOffset is appended after the caller's int
 * variables, e.g. to give each action its own set of tiles.
 */
class TileCoder : public ns3::Object
{
public:
  static ns3::TypeId GetTypeId (void);

  TileCoder ();
  virtual ~TileCoder ();

  std::vector<int> GetTiles (const std::vector<double> &state) const;
  std::vector<int> GetTiles (const std::vector<double> &state, const std::vector<int> &ints) const;

  /**
   * \brief Raw array variant; tilesArray must hold GetNumTilings() entries.
   */
  void GetTiles (const double state[], int numFloats, const int ints[], int numInts,
                 int tilesArray[]) const;

  /**
   * \brief Dense feature vector: 1.0 at the active tiles, 0.0 elsewhere.
   */
  std::vector<double> Project (const std::vector<double> &state) const;

  /**
   * \brief Set the active tiles of an existing feature vector to 1.0.
   *
   * phi must have GetDim() entries; other entries are left untouched.
   */
  void ProjectOnto (const std::vector<double> &state, std::vector<double> &phi) const;

  uint32_t GetDim (void) const;
  uint32_t GetNumTilings (void) const;

  /**
   * \return true if both coders produce the same features for every state
   */
  bool IsEquivalent (ns3::Ptr<const TileCoder> other) const;

private:
  uint32_t m_ntiling;     // number of tilings, i.e. active tiles per state
  uint32_t m_ntiles;      // memory size
  bool m_useIntOffset;
  int32_t m_intOffset;
};

} // namespace tilecoding

#endif // TILECODING_TILE_CODER_H
