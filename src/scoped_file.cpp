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
#include "log.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace fs = boost::filesystem;

namespace critic
{

scoped_file::scoped_file(std::string const& path, bool retain)
    : file(path), retained(retain)
  {
  }

scoped_file::~scoped_file()
  {
  remove();
  }

scoped_file::scoped_file(scoped_file&& rhs)
    : file(std::move(rhs.file)), retained(rhs.retained)
  {
  rhs.file.clear();
  }

scoped_file& scoped_file::operator=(scoped_file&& rhs)
  {
  remove();
  file = std::move(rhs.file);
  retained = rhs.retained;
  rhs.file.clear();
  return *this;
  }

std::string scoped_file::unique_path(std::string const& model, std::string const& directory)
  {
  fs::path const name = fs::unique_path(fs::path(model));
  return directory.empty()
    ? name.generic_string()
    : (fs::path(directory) / name).generic_string();
  }

void scoped_file::create()
  {
  write(std::string());
  }

void scoped_file::write(std::string const& content)
  {
  std::ofstream out(file.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out || !(out << content) || !out.flush())
    {
    throw std::runtime_error("cannot write " + file);
    }
  }

void scoped_file::remove()
  {
  if (file.empty())
    {
    return;
    }
  if (retained)
    {
    Log::info() << "keeping " << file << std::endl;
    return;
    }
  boost::system::error_code ec;
  fs::remove(fs::path(file), ec);
  if (ec)
    {
    Log::warn() << "could not remove " << file << ": " << ec.message() << std::endl;
    }
  }

} // namespace critic
