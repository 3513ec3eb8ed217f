/* util.cpp

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

#include <hexlat/util.hpp>
#include <cstdio>
#include <cstdlib>
#ifndef __WIN32__
#include <execinfo.h>
#endif

namespace hexlat {

#ifdef __WIN32__
static void print_trace() {}
#else
static void print_trace() {
  void* frames[20];
  int size = backtrace(frames, 20);
  char** symbols = backtrace_symbols(frames, size);

  fprintf(stderr, "Obtained %d stack frames.\n", size);
  for (int i = 0; i < size; i++)
    fprintf(stderr, "%s\n", symbols[i]);

  free(symbols);
}
#endif

void die(const char* str) {
  #ifndef NDEBUG
  print_trace();
  #endif

  fprintf(stderr, "%s\n", str);
  exit(1);
}

std::string format(const char* fmt) {
  std::stringstream result;
  while (*fmt) {
    if (*fmt == '%' && *(++fmt) != '%')
      die("too few arguments given to format");
    result << *fmt++;
  }
  return result.str();
}

}
