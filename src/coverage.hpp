// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_COVERAGE_HPP
# define CRITIC_COVERAGE_HPP

# include "line_classifier.hpp"
# include "line_set.hpp"
# include <ostream>
# include <string>
# include <vector>

namespace critic
{

class symbol_registry;
class trace_correlator;
struct file_hits;

struct report_options
{
    report_options()
        : minimum_percent(0)
        , ignored_lowers_percent(true)
        , color(false)
        , debug(false)
    {}

    unsigned minimum_percent;

    // When set, ignored lines stay in the denominator of the percentage
    // and only drop out of the uncovered listing.  When clear, they are
    // exempt from both.
    bool ignored_lowers_percent;

    bool color;
    bool debug;
};

struct coverage_result
{
    coverage_result()
        : total_lines(0)
        , code_lines(0)
        , percent(100)
        , meets_minimum(true)
    {}

    bool ok() const { return error.empty(); }

    std::string path;
    std::string error;          // why the file could not be measured

    unsigned total_lines;
    unsigned code_lines;        // neither blank nor comment
    line_classes classes;

    line_set measurable;
    line_set ignored;
    line_set covered;           // after heredoc expansion, within measurable
    line_set uncovered;
    unsigned percent;
    bool meets_minimum;
};

// covered_lines are the deduplicated lines hit by the trace, before
// heredoc expansion.
coverage_result measure(
    std::string const& path,
    std::vector<std::string> const& lines,
    line_set covered_lines,
    report_options const& opts);

// Reads the file; a file that cannot be read yields a result carrying
// the error instead of throwing.
coverage_result measure_file(
    std::string const& path, file_hits const* hits, report_options const& opts);

class coverage_report
{
 public:
    explicit coverage_report(report_options const& opts);

    void add(coverage_result result);

    void print(std::ostream& os) const;

    std::vector<coverage_result> const& results() const { return results_; }

    bool all_met_minimum() const;
    bool any_errors() const;

 private:
    void print_result(std::ostream& os, coverage_result const& r) const;

    report_options opts_;
    std::vector<coverage_result> results_;
};

// Measures every file declaring a subject symbol, plus any named
// explicitly, against the hits in the trace.
coverage_report report_coverage(
    symbol_registry const& symbols,
    trace_correlator const& trace,
    std::vector<std::string> const& extra_sources,
    report_options const& opts);

}

#endif // CRITIC_COVERAGE_HPP
