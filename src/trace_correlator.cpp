// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "trace_correlator.hpp"
#include "symbol_registry.hpp"
#include "parse_trace.hpp"
#include "file_identity.hpp"
#include "log.hpp"

#include <fstream>
#include <stdexcept>

namespace critic
{

line_set file_hits::covered_lines() const
{
    // A multiset iterates in order, so hinting at the end keeps this linear
    line_set covered;
    for (unsigned l : line_hits)
        covered.insert(covered.end(), l);
    return covered;
}

trace_correlator::trace_correlator(symbol_registry const& symbols)
    : symbols_(symbols)
    , kept_(0)
    , discarded_(0)
    , skipped_(0)
{}

bool trace_correlator::consume(trace_event const& event)
{
    if (symbols_.is_excluded_file(event.file))
    {
        ++discarded_;
        return false;
    }

    file_hits& hits = files_[absolute_path(event.file, symbols_.base_directory())];
    hits.line_hits.insert(event.line);
    if (!event.symbol.empty() && symbols_.is_subject(event.symbol))
        hits.symbol_hits.insert(event.symbol);

    ++kept_;
    return true;
}

void trace_correlator::consume(std::istream& trace)
{
    std::string line;
    while (std::getline(trace, line))
    {
        boost::optional<trace_event> event = parse_trace_line(line);
        if (!event)
        {
            ++skipped_;
            Log::trace() << "trace: skipping '" << line << "'" << std::endl;
            continue;
        }
        consume(*event);
    }
    Log::debug() << "trace: " << kept_ << " events kept, "
                 << discarded_ << " from harness or test file, "
                 << skipped_ << " unparsed lines" << std::endl;
}

void trace_correlator::consume_file(std::string const& filename)
{
    std::ifstream file(filename.c_str());
    if (!file)
    {
        throw std::runtime_error("cannot read trace: " + filename);
    }
    consume(file);
}

file_hits const* trace_correlator::hits(std::string const& path) const
{
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

}
