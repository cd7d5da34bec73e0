/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "log.hpp"
#include <cstdlib>

namespace Log
{

static Level current_level = Log::Info;

static std::string file;
static std::string file_reported;
static std::ostream dummy(0);
static std::size_t num_errors = 0;

void set_level(Level value)
  {
  current_level = value;
  }

Level level()
  {
  return current_level;
  }

static void check_file(std::ostream& os)
  {
  if (file == file_reported)
    {
    return;
    }
  file_reported = file;
  if (!file.empty())
    {
    os << "\n[critic] " << file << std::endl;
    }
  }

void set_file(std::string const& path)
  {
  file = path;
  }

std::ostream& error()
  {
  ++num_errors;
  check_file(std::cerr);
  return std::cerr << "++ ERROR: ";
  }

std::ostream& trace()
  {
  if (current_level < Log::Trace)
    {
    return dummy;
    }
  check_file(std::cout);
  return std::cout << "-- ";
  }

std::ostream& debug()
  {
  if (current_level < Log::Debug)
    {
    return dummy;
    }
  check_file(std::cout);
  return std::cout << "-- ";
  }

std::ostream& info()
  {
  if (current_level < Log::Info)
    {
    return dummy;
    }
  check_file(std::cout);
  return std::cout << "-- ";
  }

std::ostream& warn()
  {
  check_file(std::cout);
  return std::cout << "++ WARNING: ";
  }

std::size_t error_count()
  {
  return num_errors;
  }

void reset()
  {
  num_errors = 0;
  file.clear();
  file_reported.clear();
  }

int result()
  {
  if (num_errors == 0)
    {
    return EXIT_SUCCESS;
    }
  std::cerr << "\n" << num_errors << " Errors occured!" << std::endl;
  return EXIT_FAILURE;
  }

} // namespace Log
