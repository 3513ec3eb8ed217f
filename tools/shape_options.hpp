/* shape_options.hpp

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

#ifndef SHAPE_OPTIONS_HPP
#define SHAPE_OPTIONS_HPP

#include <hexlat/direction.hpp>
#include <hexlat/layout.hpp>
#include <string>
#include <vector>

struct Shape_Options {
  hexlat::Orientation_Kind orientation;
  double size;
  double origin_x;
  double origin_y;
  std::string shape;
  int radius;
  int width;
  int height;
  bool hollow;
  bool corners;
};

/// Parse the command line. Invalid options terminate the program with die.
Shape_Options parse_shape_options(int argc, char* argv[]);

hexlat::Layout make_layout(const Shape_Options& options);

/// Cells of the configured shape. Throws the hexlat exceptions for bad dimensions.
std::vector<hexlat::Hexi> make_shape(const Shape_Options& options);

#endif
