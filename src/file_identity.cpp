// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "file_identity.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

namespace fs = boost::filesystem;

namespace critic
{

std::string absolute_path(std::string const& file, std::string const& base)
{
    fs::path const base_dir = base.empty()
        ? fs::current_path()
        : fs::absolute(fs::path(base));
    return fs::absolute(fs::path(file), base_dir).lexically_normal().generic_string();
}

std::string file_name(std::string const& file)
{
    return fs::path(file).filename().generic_string();
}

}
