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

#include <limits>
#include "ns3/abort.h"
#include "ns3/boolean.h"
#include "ns3/integer.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"
#include "tile-coder.h"

using namespace ns3;

NS_LOG_COMPONENT_DEFINE ("TileCoder");

namespace tilecoding {

NS_OBJECT_ENSURE_REGISTERED (TileCoder);

TypeId
TileCoder::GetTypeId (void)
{
  static TypeId tid = TypeId ("tilecoding::TileCoder")
    .SetParent<Object> ()
    .SetGroupName ("TileCoding")
    .AddConstructor<TileCoder> ()
    .AddAttribute ("NumTilings",
                   "Number of offset tilings, i.e. active tiles per state",
                   UintegerValue (8),
                   MakeUintegerAccessor (&TileCoder::m_ntiling),
                   MakeUintegerChecker<uint32_t> (1, std::numeric_limits<int32_t>::max ()))
    .AddAttribute ("MemorySize",
                   "Total number of possible tiles",
                   UintegerValue (10000),
                   MakeUintegerAccessor (&TileCoder::m_ntiles),
                   MakeUintegerChecker<uint32_t> (1, std::numeric_limits<int32_t>::max ()))
    .AddAttribute ("UseIntOffset",
                   "Append IntOffset to the int variables of every state",
                   BooleanValue (false),
                   MakeBooleanAccessor (&TileCoder::m_useIntOffset),
                   MakeBooleanChecker ())
    .AddAttribute ("IntOffset",
                   "Int variable appended when UseIntOffset is set",
                   IntegerValue (0),
                   MakeIntegerAccessor (&TileCoder::m_intOffset),
                   MakeIntegerChecker<int32_t> ())
  ;
  return tid;
}

TileCoder::TileCoder ()
  : m_ntiling (8),
    m_ntiles (10000),
    m_useIntOffset (false),
    m_intOffset (0)
{
  NS_LOG_FUNCTION (this);
}

TileCoder::~TileCoder ()
{
  NS_LOG_FUNCTION (this);
}

void
TileCoder::GetTiles (const double state[], int numFloats, const int ints[], int numInts,
                     int tilesArray[]) const
{
  NS_LOG_FUNCTION (this << numFloats << numInts);
  if (!m_useIntOffset)
    {
      tiles (tilesArray, m_ntiling, m_ntiles, state, numFloats, ints, numInts);
      return;
    }

  NS_ABORT_MSG_IF (numInts < 0 || numInts >= TILECODING_MAX_NUM_COORDS,
                   "TileCoder: too many int variables (" << numInts << ")");
  int extended[TILECODING_MAX_NUM_COORDS];
  for (int i = 0; i < numInts; i++)
    {
      extended[i] = ints[i];
    }
  extended[numInts] = m_intOffset;
  tiles (tilesArray, m_ntiling, m_ntiles, state, numFloats, extended, numInts + 1);
}

std::vector<int>
TileCoder::GetTiles (const std::vector<double> &state, const std::vector<int> &ints) const
{
  std::vector<int> tilesArray (m_ntiling);
  GetTiles (state.data (), static_cast<int> (state.size ()),
            ints.data (), static_cast<int> (ints.size ()), tilesArray.data ());
  return tilesArray;
}

std::vector<int>
TileCoder::GetTiles (const std::vector<double> &state) const
{
  return GetTiles (state, std::vector<int> ());
}

std::vector<double>
TileCoder::Project (const std::vector<double> &state) const
{
  std::vector<double> phi (m_ntiles, 0.0);
  ProjectOnto (state, phi);
  return phi;
}

void
TileCoder::ProjectOnto (const std::vector<double> &state, std::vector<double> &phi) const
{
  NS_ABORT_MSG_UNLESS (phi.size () == m_ntiles,
                       "TileCoder: feature vector has " << phi.size () << " entries, expected "
                       << m_ntiles);
  std::vector<int> active = GetTiles (state);
  for (uint32_t i = 0; i < active.size (); i++)
    {
      phi[active[i]] = 1.0;
    }
}

uint32_t
TileCoder::GetDim (void) const
{
  return m_ntiles;
}

uint32_t
TileCoder::GetNumTilings (void) const
{
  return m_ntiling;
}

bool
TileCoder::IsEquivalent (Ptr<const TileCoder> other) const
{
  NS_ABORT_MSG_IF (!other, "TileCoder: compared with a null coder");
  if (GetDim () != other->GetDim () || m_ntiling != other->m_ntiling)
    {
      return false;
    }
  if (m_useIntOffset != other->m_useIntOffset)
    {
      return false;
    }
  return !m_useIntOffset || m_intOffset == other->m_intOffset;
}

} // namespace tilecoding
