// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#undef NDEBUG
#include "line_set.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <vector>

using namespace critic;

int main()
{
    line_set s;
    s |= std::vector<unsigned>{ 5, 3, 5, 5, 1, 3 };
    line_set expected = { 1, 3, 5 };
    assert(s == expected);

    line_set all = all_lines(6);
    line_set expected_all = { 1, 2, 3, 4, 5, 6 };
    assert(all == expected_all);
    assert(all_lines(0).empty());

    line_set rest = all - s;
    line_set expected_rest = { 2, 4, 6 };
    assert(rest == expected_rest);

    line_set both = all & line_set{ 0, 2, 7, 6 };
    line_set expected_both = { 2, 6 };
    assert(both == expected_both);

    line_set joined = rest | s;
    assert(joined == all);

    std::ostringstream os;
    os << rest;
    std::cout << os.str() << std::endl;
    assert(os.str() == "2 4 6");

    std::ostringstream empty;
    empty << line_set();
    assert(empty.str().empty());
}
