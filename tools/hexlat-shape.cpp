/* hexlat-shape.cpp

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

// Print the pixel geometry of a hex map shape.

#include "shape_options.hpp"
#include <hexlat.hpp>

using namespace hexlat;

int main(int argc, char* argv[]) {
  Shape_Options options = parse_shape_options(argc, argv);

  try {
    Scoped_Default_Layout layout(make_layout(options));
    Hex_Map<int> map = Hex_Map<int>::from_hexes(make_shape(options));
    int n = 0;
    for (auto& entry : map)
      entry.second = n++;

    for (auto& entry : map) {
      log_print("%s %s %s\n", entry.second, entry.first, to_pixel(entry.first));
      if (options.corners) {
        for (auto& corner : polygon_corners(entry.first))
          log_print("  %s\n", corner);
      }
    }

    Rectd bounds = map.pixel_bounds(default_layout());
    if (bounds.empty())
      log_print("%s cells\n", map.size());
    else
      log_print("%s cells, pixel bounds %s to %s\n", map.size(), bounds.min(), bounds.max());
  } catch (Hex_Exception& e) {
    die(e.what());
  }
  return 0;
}
