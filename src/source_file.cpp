// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "source_file.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace critic
{

std::vector<std::string> split_lines(std::string const& text)
{
    std::vector<std::string> lines;
    if (text.empty())
        return lines;

    boost::split(lines, text, boost::is_any_of("\n"));
    if (boost::ends_with(text, "\n"))
        lines.pop_back();

    // Scripts edited on Windows
    for (std::string& line : lines)
    {
        if (boost::ends_with(line, "\r"))
            line.erase(line.size() - 1);
    }
    return lines;
}

static std::string read_file(std::string const& path)
{
    std::ifstream file(path.c_str(), std::ios::in | std::ios::binary);
    if (!file || !boost::filesystem::is_regular_file(path))
    {
        throw std::runtime_error("cannot read source file: " + path);
    }
    std::string text(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw std::runtime_error("error while reading source file: " + path);
    }
    return text;
}

source_file::source_file(std::string const& path)
    : path_(path)
    , lines_(split_lines(read_file(path)))
{}

source_file::source_file(std::string const& path, std::string const& text)
    : path_(path)
    , lines_(split_lines(text))
{}

}
