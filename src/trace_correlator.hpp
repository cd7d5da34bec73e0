// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_TRACE_CORRELATOR_HPP
# define CRITIC_TRACE_CORRELATOR_HPP

# include "line_set.hpp"
# include "trace_event.hpp"
# include <istream>
# include <map>
# include <set>
# include <string>

namespace critic
{

class symbol_registry;

// What the trace says about one file
struct file_hits
{
    std::multiset<unsigned> line_hits;
    std::set<std::string> symbol_hits;

    // Each line hit at least once, exactly once
    line_set covered_lines() const;
};

// Folds a trace into per-file hits, dropping everything that happened
// in the harness or the test specification.
class trace_correlator
{
 public:
    explicit trace_correlator(symbol_registry const& symbols);

    // Returns false if the event was discarded
    bool consume(trace_event const& event);

    // Consumes every well-formed line of a trace log
    void consume(std::istream& trace);

    // Throws std::runtime_error if the file cannot be read
    void consume_file(std::string const& filename);

    // Null if nothing in the file was traced.  path must be absolute.
    file_hits const* hits(std::string const& path) const;

    std::map<std::string, file_hits> const& files() const { return files_; }

    std::size_t events_kept() const { return kept_; }
    std::size_t events_discarded() const { return discarded_; }
    std::size_t lines_skipped() const { return skipped_; }

 private:
    symbol_registry const& symbols_;
    std::map<std::string, file_hits> files_;
    std::size_t kept_;
    std::size_t discarded_;
    std::size_t skipped_;
};

}

#endif // CRITIC_TRACE_CORRELATOR_HPP
