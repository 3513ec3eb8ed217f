/* num.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HEXLAT_NUM_HPP
#define HEXLAT_NUM_HPP

/** \file num.hpp
 * Numerical helper functions.
 */

#include <cmath>
#include <cstdlib>

namespace hexlat {

const double pi = 3.14159265358979323846;

const double sqrt3 = 1.73205080756887729353;

/**
 * Tolerance for the zero-sum check and equality of fractional coordinates.
 *
 * Also the step of the line drawing nudge on q and r, which moves s by twice
 * as much. Nudged hexes still sum to zero since s is derived from q and r.
 */
const double hex_epsilon = 1e-6;

/// Modulo function that handles negative numbers like you'd expect.
template<class Num>
Num mod(Num x, Num m) {
  return (x < 0 ? ((x % m) + m) % m : x % m);
}

/// Floor division for integers, rounds towards negative infinity.
inline int floor_div(int x, int d) {
  int q = x / d;
  if ((x % d != 0) && ((x < 0) != (d < 0)))
    --q;
  return q;
}

inline bool near_zero(int x) { return x == 0; }

inline bool near_zero(double x) { return std::fabs(x) <= hex_epsilon; }

}

#endif
