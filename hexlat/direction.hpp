/* direction.hpp

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

#ifndef HEXLAT_DIRECTION_HPP
#define HEXLAT_DIRECTION_HPP

/** \file direction.hpp
 * The six hex directions and diagonals, with clock and compass naming.
 */

#include <hexlat/hex.hpp>
#include <array>

namespace hexlat {

/**
 * The 6 hex directions, in canonical order.
 *
 * The order starts along the +q axis and proceeds around the origin so that
 * each direction is one left rotation of the previous one:
 *
 *     0: ( 1,  0, -1)    3: (-1,  0,  1)
 *     1: ( 1, -1,  0)    4: (-1,  1,  0)
 *     2: ( 0, -1,  1)    5: ( 0,  1, -1)
 */
const std::array<const Hexi, 6> hex_dirs{{
    Hexi(1, 0), Hexi(1, -1), Hexi(0, -1),
    Hexi(-1, 0), Hexi(-1, 1), Hexi(0, 1)}};

/**
 * The 6 diagonal directions.
 *
 * Diagonal `i` lies between directions `i` and `i + 1` and is their sum. The
 * diagonal neighbors are the cells at distance 2 that touch the center cell
 * only at a corner.
 */
const std::array<const Hexi, 6> hex_diagonals{{
    Hexi(2, -1), Hexi(1, -2), Hexi(-1, -1),
    Hexi(-2, 1), Hexi(-1, 2), Hexi(1, 1)}};

/// Pointy orientations have a vertex at the top of each hex, flat ones an edge.
enum Orientation_Kind {
  pointy_kind,
  flat_kind,
  custom_kind
};

enum Compass_Point {
  north,
  north_east,
  east,
  south_east,
  south,
  south_west,
  west,
  north_west
};

/// Direction vector with index 0 to 5. Throws Invalid_Direction for other indices.
const Hexi& hex_direction(int index);

/// Diagonal vector with index 0 to 5. Throws Invalid_Direction for other indices.
const Hexi& hex_diagonal(int index);

bool is_direction(const Hexi& vec);

bool is_diagonal(const Hexi& vec);

template<class T>
Hex<T> neighbor(const Hex<T>& hex, int index) {
  return hex + Hex<T>(hex_direction(index));
}

template<class T>
Hex<T> diagonal_neighbor(const Hex<T>& hex, int index) {
  return hex + Hex<T>(hex_diagonal(index));
}

/// All six adjacent cells in direction order.
template<class T>
std::array<Hex<T>, 6> neighbors(const Hex<T>& hex) {
  std::array<Hex<T>, 6> result;
  for (int i = 0; i < 6; i++)
    result[i] = neighbor(hex, i);
  return result;
}

template<class T>
std::array<Hex<T>, 6> diagonal_neighbors(const Hex<T>& hex) {
  std::array<Hex<T>, 6> result;
  for (int i = 0; i < 6; i++)
    result[i] = diagonal_neighbor(hex, i);
  return result;
}

/**
 * Return the vector pointing at an hour on a clock face laid over a hex.
 *
 * Twelve o'clock points straight up the screen. With pointy hexes the odd
 * hours point across edges at the adjacent cells and the even hours at the
 * corners, towards the diagonal cells. With flat hexes it is the other way
 * around. Custom orientations use the pointy face.
 *
 * The vectors themselves are the same direction and diagonal vectors for
 * every orientation, only the hour used to name them changes. Hours outside
 * 1 to 12 throw Invalid_Direction.
 */
Hexi o_clock(int hour, Orientation_Kind kind = pointy_kind);

template<class T>
Hex<T> clock_neighbor(const Hex<T>& hex, int hour, Orientation_Kind kind = pointy_kind) {
  return hex + Hex<T>(o_clock(hour, kind));
}

/**
 * Return the adjacent cell vector at a compass point.
 *
 * Pointy hexes have neighbors at NE, E, SE, SW, W and NW, flat ones at N,
 * NE, SE, S, SW and NW. Asking for a point the orientation has no edge at
 * throws Invalid_Direction.
 */
Hexi compass(Compass_Point point, Orientation_Kind kind = pointy_kind);

}

#endif
