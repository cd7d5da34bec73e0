// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_LINE_SET_HPP
# define CRITIC_LINE_SET_HPP

# include <boost/container/flat_set.hpp>
# include <algorithm>
# include <iterator>
# include <ostream>

namespace critic
{

// 1-based line numbers, sorted and unique
typedef boost::container::flat_set<unsigned> line_set;

// All lines 1..n
inline line_set all_lines(unsigned n)
{
    line_set result;
    result.reserve(n);
    for (unsigned l = 1; l <= n; ++l)
        result.insert(result.end(), l);
    return result;
}

template <class C>
line_set& operator |=(line_set& lhs, C const& rhs)
{
    for (auto const& x : rhs)
        lhs.insert(x);
    return lhs;
}

inline line_set operator|(line_set lhs, line_set const& rhs)
{
    return lhs |= rhs;
}

inline line_set operator-(line_set const& lhs, line_set const& rhs)
{
    line_set result;
    std::set_difference(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        std::inserter(result, result.end()));
    return result;
}

inline line_set operator&(line_set const& lhs, line_set const& rhs)
{
    line_set result;
    std::set_intersection(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        std::inserter(result, result.end()));
    return result;
}

// Space separated, the way the report lists line numbers
inline std::ostream& operator<<(std::ostream& os, line_set const& lines)
{
    char const* sep = "";
    for (unsigned l : lines)
    {
        os << sep << l;
        sep = " ";
    }
    return os;
}

}

#endif // CRITIC_LINE_SET_HPP
