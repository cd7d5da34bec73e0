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

#ifndef CRITIC_SCOPED_FILE_HPP
#define CRITIC_SCOPED_FILE_HPP

#include <string>

namespace critic
{

// Owns a file on disk for the lifetime of a run: the trace log, the
// generated prelude, the symbol dump.  The file is removed when the
// owner goes away, on every path out of the run, unless it is retained.
class scoped_file
  {
  public:
    explicit scoped_file(std::string const& path, bool retain = false);
    ~scoped_file();

    scoped_file(scoped_file const&) = delete;
    void operator=(scoped_file const&) = delete;

    scoped_file(scoped_file&& rhs);
    scoped_file& operator=(scoped_file&& rhs);

    // A fresh name in directory built from model, whose '%' characters
    // are replaced by random hex digits
    static std::string unique_path(
        std::string const& model, std::string const& directory = std::string());

    // Creates the file empty, truncating anything already there.
    // Throws std::runtime_error on failure.
    void create();

    // Creates the file with the given content
    void write(std::string const& content);

    void retain(bool value = true)
      {
      retained = value;
      }
    bool is_retained() const
      {
      return retained;
      }
    std::string const& path() const
      {
      return file;
      }

  private:
    void remove();

  private:
    std::string file;
    bool retained;
  };

} // namespace critic

#endif /* CRITIC_SCOPED_FILE_HPP */
