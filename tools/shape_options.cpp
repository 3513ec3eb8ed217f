/* shape_options.cpp

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

#include "shape_options.hpp"
#include <hexlat/util.hpp>
#include <hexlat/shape.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>

using namespace std;
using namespace boost::program_options;
using namespace hexlat;

Shape_Options parse_shape_options(int argc, char* argv[]) {
  Shape_Options result;
  string orientation;
  try {
    options_description desc("Options");
    desc.add_options()
        ("help", "Show this message")
        ("orientation", value<string>(&orientation)->default_value("pointy"), "Hex orientation, pointy or flat")
        ("size", value<double>(&result.size)->default_value(10.0), "Distance from hex center to corner in pixels")
        ("origin-x", value<double>(&result.origin_x)->default_value(0.0), "Pixel x of the origin hex center")
        ("origin-y", value<double>(&result.origin_y)->default_value(0.0), "Pixel y of the origin hex center")
        ("shape", value<string>(&result.shape)->default_value("hexagon"),
         "Shape to generate: hexagon, rectangle, square, rhombus or triangle")
        ("radius", value<int>(&result.radius)->default_value(2), "Radius of hexagons and rhombi, side of triangles and squares")
        ("width", value<int>(&result.width)->default_value(4), "Rectangle width in cells")
        ("height", value<int>(&result.height)->default_value(3), "Rectangle height in cells")
        ("hollow", bool_switch(&result.hollow), "Generate only the border of the shape")
        ("corners", bool_switch(&result.corners), "Print the corner points of every hex")
        ;
    variables_map vm;
    store(parse_command_line(argc, argv, desc), vm);
    notify(vm);

    if (vm.count("help")) {
      cout << desc << "\n";
      exit(0);
    }
  } catch (exception& e) {
    die(e.what());
  }

  if (orientation == "pointy")
    result.orientation = pointy_kind;
  else if (orientation == "flat")
    result.orientation = flat_kind;
  else
    die("Unknown orientation '%s'", orientation);

  return result;
}

Layout make_layout(const Shape_Options& options) {
  const Orientation& orientation =
      options.orientation == flat_kind ? Orientation::flat() : Orientation::pointy();
  return Layout(orientation, options.size, Vec2d(options.origin_x, options.origin_y));
}

std::vector<Hexi> make_shape(const Shape_Options& options) {
  if (options.shape == "hexagon")
    return hexagon_shape(options.radius, origin, options.hollow);
  if (options.shape == "rectangle")
    return rectangle_shape(options.width, options.height, options.orientation, origin, options.hollow);
  if (options.shape == "square")
    return square_shape(options.radius, options.orientation, origin, options.hollow);
  if (options.shape == "rhombus")
    return rhombus_shape(options.radius, q_axis, s_axis, origin, options.hollow);
  if (options.shape == "triangle")
    return triangle_shape(options.radius, origin, options.hollow);
  die("Unknown shape '%s'", options.shape);
  return std::vector<Hexi>();
}
