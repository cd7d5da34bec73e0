// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "heredoc.hpp"
#include "log.hpp"

namespace critic
{

std::size_t expand_heredocs(std::vector<heredoc> const& heredocs, line_set& covered)
{
    std::size_t const before = covered.size();
    for (heredoc const& h : heredocs)
    {
        if (covered.find(h.start) == covered.end())
            continue;

        Log::trace() << "heredoc " << h.terminator << " at line " << h.start
                     << " covers through line " << h.body_end << std::endl;
        for (unsigned l = h.start + 1; l <= h.body_end; ++l)
            covered.insert(l);
    }
    return covered.size() - before;
}

}
