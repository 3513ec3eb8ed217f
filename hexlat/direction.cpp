/* direction.cpp

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

#include "direction.hpp"
#include <hexlat/num.hpp>
#include <algorithm>

using namespace std;

namespace hexlat {

const Hexi& hex_direction(int index) {
  if (index < 0 || index >= 6)
    throw Invalid_Direction();
  return hex_dirs[index];
}

const Hexi& hex_diagonal(int index) {
  if (index < 0 || index >= 6)
    throw Invalid_Direction();
  return hex_diagonals[index];
}

bool is_direction(const Hexi& vec) {
  return find(hex_dirs.begin(), hex_dirs.end(), vec) != hex_dirs.end();
}

bool is_diagonal(const Hexi& vec) {
  return find(hex_diagonals.begin(), hex_diagonals.end(), vec) != hex_diagonals.end();
}

Hexi o_clock(int hour, Orientation_Kind kind) {
  if (hour < 1 || hour > 12)
    throw Invalid_Direction();

  // Going clockwise on the screen walks the tables backwards. One o'clock is
  // direction 1 on pointy hexes and diagonal 1 on flat ones, and each two
  // hours step one table entry down.
  bool odd = hour % 2 == 1;
  if (kind == flat_kind) {
    if (odd)
      return hex_diagonals[mod(1 - (hour - 1) / 2, 6)];
    return hex_dirs[mod(2 - hour / 2, 6)];
  }
  if (odd)
    return hex_dirs[mod(1 - (hour - 1) / 2, 6)];
  return hex_diagonals[mod(1 - hour / 2, 6)];
}

Hexi compass(Compass_Point point, Orientation_Kind kind) {
  // Clock hours of the compass points, zero where the orientation has a
  // corner instead of an edge.
  static const int pointy_hours[] = {0, 1, 3, 5, 0, 7, 9, 11};
  static const int flat_hours[] = {12, 2, 0, 4, 6, 8, 0, 10};

  if (point < north || point > north_west)
    throw Invalid_Direction();
  int hour = (kind == flat_kind ? flat_hours : pointy_hours)[point];
  if (hour == 0)
    throw Invalid_Direction();
  return o_clock(hour, kind);
}

}
