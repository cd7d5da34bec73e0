/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
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

#include "scoped_file.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/filesystem/operations.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

using namespace critic;
namespace fs = boost::filesystem;

namespace
{
  std::string temp_name()
    {
    return scoped_file::unique_path(
        "critic-scoped-%%%%-%%%%.log", fs::temp_directory_path().generic_string());
    }

  std::string contents(std::string const& path)
    {
    std::ifstream in(path.c_str());
    return std::string(
        (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

BOOST_AUTO_TEST_CASE(file_is_removed_with_its_owner)
  {
  std::string const path = temp_name();
    {
    scoped_file file(path);
    file.create();
    BOOST_CHECK(fs::exists(path));
    BOOST_CHECK_EQUAL(fs::file_size(path), 0u);
    }
  BOOST_CHECK(!fs::exists(path));
  }

BOOST_AUTO_TEST_CASE(file_is_removed_when_the_run_throws)
  {
  std::string const path = temp_name();
  try
    {
    scoped_file file(path);
    file.write("(lib.sh:3): a=1\n");
    throw std::runtime_error("test script failed");
    }
  catch (std::runtime_error const&)
    {
    }
  BOOST_CHECK(!fs::exists(path));
  }

BOOST_AUTO_TEST_CASE(retained_file_survives)
  {
  std::string const path = temp_name();
    {
    scoped_file file(path, true);
    BOOST_CHECK(file.is_retained());
    file.write("kept\n");
    }
  BOOST_CHECK(fs::exists(path));
  BOOST_CHECK_EQUAL(contents(path), "kept\n");
  fs::remove(path);

    {
    scoped_file file(path);
    file.create();
    file.retain();
    }
  BOOST_CHECK(fs::exists(path));
  fs::remove(path);
  }

BOOST_AUTO_TEST_CASE(ownership_moves)
  {
  std::string const path = temp_name();
    {
    scoped_file outer(temp_name());
      {
      scoped_file inner(path);
      inner.create();
      outer = std::move(inner);
      BOOST_CHECK(inner.path().empty());
      }
    BOOST_CHECK(fs::exists(path));
    BOOST_CHECK_EQUAL(outer.path(), path);
    }
  BOOST_CHECK(!fs::exists(path));
  }

BOOST_AUTO_TEST_CASE(missing_file_is_not_an_error)
  {
  std::string const path = temp_name();
    {
    scoped_file file(path);
    }
  BOOST_CHECK(!fs::exists(path));
  }

BOOST_AUTO_TEST_CASE(unwritable_file_throws)
  {
  scoped_file file("/nonexistent/critic/trace.log");
  BOOST_CHECK_THROW(file.create(), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(unique_paths_differ)
  {
  std::string const a = scoped_file::unique_path(".critic-trace-%%%%-%%%%.log");
  std::string const b = scoped_file::unique_path(".critic-trace-%%%%-%%%%.log");
  BOOST_CHECK(a != b);
  BOOST_CHECK(a.find('%') == std::string::npos);
  BOOST_CHECK_EQUAL(a.substr(0, 14), ".critic-trace-");

  std::string const c = scoped_file::unique_path("x-%%%%", "/work");
  BOOST_CHECK_EQUAL(c.substr(0, 8), "/work/x-");
  }
