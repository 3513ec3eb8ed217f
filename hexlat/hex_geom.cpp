/* hex_geom.cpp

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

#include "hex_geom.hpp"
#include <hexlat/direction.hpp>
#include <hexlat/num.hpp>
#include <hexlat/util.hpp>
#include <boost/range/counting_range.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <algorithm>

using namespace boost;
using namespace boost::adaptors;
using namespace std;

namespace hexlat {

int hex_circumference(int radius) {
  if (radius < 0 || radius > max_hex_radius)
    throw Invalid_Radius();
  if (radius == 0)
    return 1;
  return radius * 6;
}

int hex_area_size(int radius) {
  if (radius < 0 || radius > max_hex_radius)
    throw Invalid_Radius();
  return 3 * radius * (radius + 1) + 1;
}

Hexi hex_ring_vec(int radius, int index) {
  if (radius < 0 || radius > max_hex_radius)
    throw Invalid_Radius();

  if (radius == 0)
    return origin;

  int sector = mod(index, hex_circumference(radius)) / radius;
  int offset = mod(index, radius);
  return hex_dirs[sector] * radius + hex_dirs[(sector + 2) % 6] * offset;
}

Range<Hexi>::T hex_ring(const Hexi& center, int radius) {
  int size = hex_circumference(radius);
  return counting_range(0, size)
      | transformed([=](int i) { return center + hex_ring_vec(radius, i); });
}

std::vector<Hexi> hex_range(const Hexi& center, int radius) {
  if (radius < 0 || radius > max_hex_radius)
    throw Invalid_Radius();

  std::vector<Hexi> result;
  result.reserve(hex_area_size(radius));
  for (int q = -radius; q <= radius; q++) {
    int r1 = std::max(-radius, -q - radius);
    int r2 = std::min(radius, -q + radius);
    for (int r = r1; r <= r2; r++)
      result.push_back(center + Hexi(q, r));
  }
  HEXLAT_ASSERT(static_cast<int>(result.size()) == hex_area_size(radius));
  return result;
}

static Hexi hex_spiral_vec(int index) {
  if (index == 0)
    return origin;
  int radius = 1;
  while (hex_area_size(radius) <= index)
    radius++;
  return hex_ring_vec(radius, index - hex_area_size(radius - 1));
}

Range<Hexi>::T hex_spiral(const Hexi& center, int radius) {
  int size = hex_area_size(radius);
  return counting_range(0, size)
      | transformed([=](int i) { return center + hex_spiral_vec(i); });
}

Range<Hexi>::T hex_line(const Hexi& a, const Hexi& b) {
  int n = a.distance_to(b);
  Hexd start = a.nudged();
  Hexd end = b.nudged();
  double step = 1.0 / std::max(n, 1);
  return counting_range(0, n + 1)
      | transformed([=](int i) { return start.lerp_to(end, i * step).rounded(); });
}

std::vector<Hexi> hex_outline(const std::vector<Hexi>& corners) {
  std::vector<Hexi> result;
  if (corners.size() == 1) {
    result.push_back(corners[0]);
    return result;
  }
  for (size_t i = 0; i < corners.size(); i++) {
    auto line = to_vector(hex_line(corners[i], corners[(i + 1) % corners.size()]));
    // The last cell of each segment starts the next one.
    result.insert(result.end(), line.begin(), line.end() - 1);
  }
  return result;
}

}
