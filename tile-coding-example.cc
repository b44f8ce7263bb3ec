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
 * Encode a state vector given on the command line, e.g.
 *
 *   tile-coding-example --nTilings=8 --memorySize=4096 \
 *       --floats=-0.52,0.01 --tileWidth=0.17,0.014 --ints=2
 *
 * and optionally sweep the first variable to see how many tiles change.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "ns3/core-module.h"
#include "tile-coder.h"

using namespace ns3;
using namespace tilecoding;

NS_LOG_COMPONENT_DEFINE ("TileCodingExample");

template <typename T>
static std::vector<T>
ParseList (const std::string &str)
{
  std::vector<T> values;
  std::istringstream iss (str);
  std::string item;
  while (std::getline (iss, item, ','))
    {
      if (item.empty ())
        {
          continue;
        }
      std::istringstream is (item);
      T value;
      is >> value;
      NS_ABORT_MSG_IF (is.fail () || !is.eof (), "cannot parse '" << item << "'");
      values.push_back (value);
    }
  return values;
}

static void
PrintTiles (const std::vector<double> &state, const std::vector<int> &active)
{
  std::cout << "State vector: [ ";
  for (uint32_t i = 0; i < state.size (); i++)
    {
      std::cout << state[i] << " ";
    }
  std::cout << "] tiles: [ ";
  for (uint32_t i = 0; i < active.size (); i++)
    {
      std::cout << active[i] << " ";
    }
  std::cout << "]" << std::endl;
}

int
main (int argc, char *argv[])
{
  uint32_t    nTilings = 8;
  uint32_t    memorySize = 10000;
  std::string floatsStr = "2.5";
  std::string intsStr = "";
  std::string tileWidthStr = "";
  uint32_t    sweep = 0;             // number of sweep steps, 0 disables the sweep
  double      step = 0.05;           // sweep step in physical units

  CommandLine cmd;
  cmd.AddValue ("nTilings", "Number of tilings, i.e. active tiles per state", nTilings);
  cmd.AddValue ("memorySize", "Total number of possible tiles", memorySize);
  cmd.AddValue ("floats", "Comma separated float variables", floatsStr);
  cmd.AddValue ("ints", "Comma separated int variables", intsStr);
  cmd.AddValue ("tileWidth", "Comma separated tile width per float variable, default is 1", tileWidthStr);
  cmd.AddValue ("sweep", "Number of steps to sweep the first float variable", sweep);
  cmd.AddValue ("step", "Sweep step of the first float variable, default is 0.05", step);
  cmd.Parse (argc, argv);

  Config::SetDefault ("tilecoding::TileCoder::NumTilings", UintegerValue (nTilings));
  Config::SetDefault ("tilecoding::TileCoder::MemorySize", UintegerValue (memorySize));

  std::vector<double> physical = ParseList<double> (floatsStr);
  std::vector<int> ints = ParseList<int> (intsStr);
  std::vector<double> widths = ParseList<double> (tileWidthStr);
  if (widths.empty ())
    {
      widths.assign (physical.size (), 1.0);
    }
  NS_ABORT_MSG_UNLESS (widths.size () == physical.size (),
                       widths.size () << " tile widths for " << physical.size () << " floats");
  for (uint32_t i = 0; i < widths.size (); i++)
    {
      NS_ABORT_MSG_UNLESS (widths[i] > 0, "tile width must be positive");
    }

  Ptr<TileCoder> coder = CreateObject<TileCoder> ();

  /* tiles are unit width, scale every variable by its tile width */
  std::vector<double> state (physical.size ());
  for (uint32_t i = 0; i < physical.size (); i++)
    {
      state[i] = physical[i] / widths[i];
    }
  std::vector<int> active = coder->GetTiles (state, ints);
  PrintTiles (physical, active);

  if (sweep > 0 && !physical.empty ())
    {
      std::vector<int> prev = active;
      for (uint32_t s = 1; s <= sweep; s++)
        {
          physical[0] += step;
          state[0] = physical[0] / widths[0];
          std::vector<int> cur = coder->GetTiles (state, ints);
          uint32_t changed = 0;
          for (uint32_t j = 0; j < cur.size (); j++)
            {
              if (cur[j] != prev[j])
                {
                  changed++;
                }
            }
          NS_LOG_INFO ("step " << s << ": " << changed << " of " << cur.size () << " tiles changed");
          std::cout << "x0 = " << physical[0] << " changed " << changed << " of "
                    << cur.size () << " tiles" << std::endl;
          prev = cur;
        }
    }

  return 0;
}
