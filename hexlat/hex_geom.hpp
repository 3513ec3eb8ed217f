/* hex_geom.hpp

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

#ifndef HEXLAT_HEX_GEOM_HPP
#define HEXLAT_HEX_GEOM_HPP

/** \file hex_geom.hpp
 * Lines, rings and areas on the hex lattice.
 */

#include <hexlat/hex.hpp>
#include <hexlat/alg.hpp>
#include <vector>

namespace hexlat {

/**
 * Largest radius accepted by the ring and area functions.
 *
 * The cell count of an area of this radius is the largest one that fits in
 * an int. Larger radii throw Invalid_Radius.
 */
const int max_hex_radius = 26754;

/// Number of cells on a hex ring, 1 for radius 0.
int hex_circumference(int radius);

/// Number of cells within `radius` of a center cell, 3 r (r + 1) + 1.
int hex_area_size(int radius);

/**
 * Return a vector to a point on a hexagonal ring.
 *
 * `hex_ring_vec(r, i)` points to one of the cells at distance `r` from the
 * origin. Index 0 is `r` times direction 0 and the indices proceed through
 * the ring corners in direction order. The index wraps around the ring.
 */
Hexi hex_ring_vec(int radius, int index);

/// Return the cells of a ring of `radius` around `center`, in hex_ring_vec order.
Range<Hexi>::T hex_ring(const Hexi& center, int radius);

/**
 * Return all cells within `radius` of `center`.
 *
 * Cells come in rows of increasing q, each row in increasing r.
 */
std::vector<Hexi> hex_range(const Hexi& center, int radius);

/**
 * Return all cells within `radius` of `center` as a spiral.
 *
 * The spiral starts at the center and continues with the rings of radius 1
 * to `radius`, each in hex_ring order. Unlike hex_range, any prefix of a
 * spiral is the area around the center filled up to some angle, which makes
 * this the canonical order for filling hexagon shaped maps.
 */
Range<Hexi>::T hex_spiral(const Hexi& center, int radius);

/**
 * Return the cells on a straight line from `a` to `b`, both included.
 *
 * The line has `a.distance_to(b) + 1` cells and consecutive cells are always
 * adjacent. Both endpoints are nudged by the same tiny offset before
 * interpolating, so a line running exactly along cell edges always resolves
 * to the same side and a given pair of endpoints always gives the same line.
 */
Range<Hexi>::T hex_line(const Hexi& a, const Hexi& b);

/// Closed outline of a polygon, lines between consecutive corners and back to the first.
std::vector<Hexi> hex_outline(const std::vector<Hexi>& corners);

}

#endif
