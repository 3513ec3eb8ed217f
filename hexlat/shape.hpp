/* shape.hpp

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

#ifndef HEXLAT_SHAPE_HPP
#define HEXLAT_SHAPE_HPP

/** \file shape.hpp
 * Cell sets for common map shapes.
 *
 * Every generator returns its cells in a fixed order without duplicates, so
 * a Hex_Map filled from a shape iterates the same way every time. A hollow
 * shape keeps only the cells on the shape's border.
 */

#include <hexlat/hex.hpp>
#include <hexlat/direction.hpp>
#include <utility>
#include <vector>

namespace hexlat {

/// Inclusive range of values along one axis.
typedef std::pair<int, int> Axis_Range;

/// Cells within `radius` of `center` in spiral order. Hollow gives the outer ring only.
std::vector<Hexi> hexagon_shape(int radius, const Hexi& center = origin, bool hollow = false);

/**
 * Cells whose `axis1` and `axis2` coordinates fall in the given ranges.
 *
 * The cells come in rows along `range1`. The third coordinate follows from
 * the other two. Throws Invalid_Size for a range whose end is below its
 * start and Invalid_Coordinate if both axes are the same.
 */
std::vector<Hexi> parallelogram_shape(
    Hex_Axis axis1, const Axis_Range& range1,
    Hex_Axis axis2, const Axis_Range& range2,
    const Hexi& center = origin, bool hollow = false);

/// Parallelogram extending `size` cells to both sides of `center` along both axes.
std::vector<Hexi> rhombus_shape(
    int size, Hex_Axis axis1 = q_axis, Hex_Axis axis2 = s_axis,
    const Hexi& center = origin, bool hollow = false);

/**
 * Cells of a `width` by `height` rectangle on screen.
 *
 * With pointy hexes the rectangle is made of `height` rows of `width`
 * cells, every other row shifted half a cell. With flat hexes it is made of
 * `width` columns of `height` cells. `corner` is the top left cell.
 */
std::vector<Hexi> rectangle_shape(
    int width, int height, Orientation_Kind kind = pointy_kind,
    const Hexi& corner = origin, bool hollow = false);

std::vector<Hexi> square_shape(
    int size, Orientation_Kind kind = pointy_kind,
    const Hexi& corner = origin, bool hollow = false);

/// Triangle with `size + 1` cells on each side, `corner` at its q = r = 0 corner.
std::vector<Hexi> triangle_shape(int size, const Hexi& corner = origin, bool hollow = false);

}

#endif
