// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_PARSE_TRACE_HPP
# define CRITIC_PARSE_TRACE_HPP

# include "trace_event.hpp"
# include <boost/optional.hpp>
# include <string>

namespace critic
{

// The PS4 a harness must set for its trace to be understood here
extern char const* const trace_prompt;

// Empty for interpreter noise and continuation lines of multi-line
// commands
boost::optional<trace_event> parse_trace_line(std::string const& line);

}

#endif // CRITIC_PARSE_TRACE_HPP
