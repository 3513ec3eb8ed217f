/* shape.cpp

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

#include "shape.hpp"
#include <hexlat/hex_geom.hpp>
#include <hexlat/alg.hpp>
#include <hexlat/num.hpp>

namespace hexlat {

// Push a row of cells, or only its end cells for the inner rows of a hollow
// shape.
template<class Make_Hex>
static void push_row(
    std::vector<Hexi>& result, int first, int last, bool ends_only, Make_Hex make_hex) {
  if (last < first)
    return;
  if (!ends_only) {
    for (int i = first; i <= last; i++)
      result.push_back(make_hex(i));
  } else {
    result.push_back(make_hex(first));
    if (last != first)
      result.push_back(make_hex(last));
  }
}

std::vector<Hexi> hexagon_shape(int radius, const Hexi& center, bool hollow) {
  if (radius < 0)
    throw Invalid_Radius();
  if (hollow)
    return to_vector(hex_ring(center, radius));
  return to_vector(hex_spiral(center, radius));
}

std::vector<Hexi> parallelogram_shape(
    Hex_Axis axis1, const Axis_Range& range1,
    Hex_Axis axis2, const Axis_Range& range2,
    const Hexi& center, bool hollow) {
  if (range1.second < range1.first || range2.second < range2.first)
    throw Invalid_Size();
  if (axis1 == axis2)
    throw Invalid_Coordinate();

  std::vector<Hexi> result;
  for (int c1 = range1.first; c1 <= range1.second; c1++) {
    bool edge = c1 == range1.first || c1 == range1.second;
    push_row(result, range2.first, range2.second, hollow && !edge,
             [&](int c2) { return center + Hexi::from_axes(axis1, c1, axis2, c2); });
  }
  return result;
}

std::vector<Hexi> rhombus_shape(
    int size, Hex_Axis axis1, Hex_Axis axis2, const Hexi& center, bool hollow) {
  if (size < 0)
    throw Invalid_Size();
  return parallelogram_shape(
      axis1, Axis_Range(-size, size), axis2, Axis_Range(-size, size), center, hollow);
}

std::vector<Hexi> rectangle_shape(
    int width, int height, Orientation_Kind kind, const Hexi& corner, bool hollow) {
  if (width < 0 || height < 0)
    throw Invalid_Size();

  std::vector<Hexi> result;
  if (kind == flat_kind) {
    for (int q = 0; q < width; q++) {
      int offset = floor_div(q, 2);
      bool edge = q == 0 || q == width - 1;
      push_row(result, -offset, height - 1 - offset, hollow && !edge,
               [&](int r) { return corner + Hexi(q, r); });
    }
  } else {
    for (int r = 0; r < height; r++) {
      int offset = floor_div(r, 2);
      bool edge = r == 0 || r == height - 1;
      push_row(result, -offset, width - 1 - offset, hollow && !edge,
               [&](int q) { return corner + Hexi(q, r); });
    }
  }
  return result;
}

std::vector<Hexi> square_shape(
    int size, Orientation_Kind kind, const Hexi& corner, bool hollow) {
  return rectangle_shape(size, size, kind, corner, hollow);
}

std::vector<Hexi> triangle_shape(int size, const Hexi& corner, bool hollow) {
  if (size < 0)
    throw Invalid_Size();

  std::vector<Hexi> result;
  for (int q = 0; q <= size; q++) {
    // The first column is a full side, the others touch the border at r = 0
    // and on the hypotenuse.
    push_row(result, 0, size - q, hollow && q != 0,
             [&](int r) { return corner + Hexi(q, r); });
  }
  return result;
}

}
