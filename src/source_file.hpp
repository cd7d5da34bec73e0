// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_SOURCE_FILE_HPP
# define CRITIC_SOURCE_FILE_HPP

# include <string>
# include <vector>

namespace critic
{

// Splits text into lines.  A trailing newline does not start another
// line; a last line without one still counts.
std::vector<std::string> split_lines(std::string const& text);

// A shell script read fully into memory.  Identity is the path it was
// read from.
struct source_file
{
    // Throws std::runtime_error if the file cannot be read
    explicit source_file(std::string const& path);

    source_file(std::string const& path, std::string const& text);

    std::string const& path() const { return path_; }
    std::vector<std::string> const& lines() const { return lines_; }
    unsigned line_count() const { return static_cast<unsigned>(lines_.size()); }

 private:
    std::string path_;
    std::vector<std::string> lines_;
};

}

#endif // CRITIC_SOURCE_FILE_HPP
