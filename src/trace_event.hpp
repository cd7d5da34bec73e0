// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_TRACE_EVENT_HPP
# define CRITIC_TRACE_EVENT_HPP

# include <boost/fusion/adapted/struct/define_struct.hpp>
# include <string>

// One xtrace record:  (file:line):[symbol():]args
//
// symbol is empty unless the traced statement ran inside a function.
BOOST_FUSION_DEFINE_STRUCT((critic), trace_event,
  (std::string, file)
  (unsigned, line)
  (std::string, symbol)
  (std::string, args)
  )

#endif // CRITIC_TRACE_EVENT_HPP
