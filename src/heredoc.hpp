// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_HEREDOC_HPP
# define CRITIC_HEREDOC_HPP

# include "line_classifier.hpp"
# include <vector>

namespace critic
{

// xtrace reports the command that opens a heredoc, never the lines of
// its body.  When the opening line is covered, so is everything through
// the terminator.  Returns the number of lines added.
std::size_t expand_heredocs(std::vector<heredoc> const& heredocs, line_set& covered);

}

#endif // CRITIC_HEREDOC_HPP
