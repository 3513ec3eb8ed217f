/* format.hpp

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
#ifndef HEXLAT_FORMAT_HPP
#define HEXLAT_FORMAT_HPP

/// \file format.hpp \brief Type-safe printf-style string construction.

#include <string>
#include <sstream>

namespace hexlat {

void die(const char* str);

/// Base case, fails if `fmt` still has unfilled `%s` slots.
std::string format(const char* fmt);

/**
 * Build a string from `fmt`, substituting each `%s` with the next argument.
 *
 * Arguments are written with `operator<<`, so anything printable works,
 * hexes included. `%%` gives a literal percent sign. Any other directive and
 * any mismatch between slots and arguments is a programming error and dies.
 */
template<typename T, typename... Args>
std::string format(const char* fmt, T value, Args... args) {
  std::stringstream result;

  while (*fmt) {
    if (*fmt == '%' && *(++fmt) != '%') {
      if (*fmt++ != 's')
        die("format only supports %s");
      result << value;
      result << format(fmt, args...);
      return result.str();
    } else {
      result << *fmt++;
    }
  }

  die("extra arguments given to format");
  return result.str();
}

}

#endif
