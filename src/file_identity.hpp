// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_FILE_IDENTITY_HPP
# define CRITIC_FILE_IDENTITY_HPP

# include <string>

namespace critic
{

// bash reports BASH_SOURCE relative to the directory the harness ran
// in.  Resolves such a name against base (the current directory if
// empty) and normalizes it, so every spelling of a file has the same key.
std::string absolute_path(std::string const& file, std::string const& base = std::string());

// The last path component
std::string file_name(std::string const& file);

}

#endif // CRITIC_FILE_IDENTITY_HPP
