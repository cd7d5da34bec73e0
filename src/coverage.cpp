// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "coverage.hpp"
#include "heredoc.hpp"
#include "source_file.hpp"
#include "symbol_registry.hpp"
#include "trace_correlator.hpp"
#include "file_identity.hpp"
#include "log.hpp"

#include <boost/foreach.hpp>
#include <set>
#include <stdexcept>
#include <utility>

namespace critic
{

namespace
{
  char const* const reset   = "\033[0m";
  char const* const red     = "\033[0;31m";
  char const* const green   = "\033[0;32m";
  char const* const yellow  = "\033[1;33m";
  char const* const magenta = "\033[0;35m";
  char const* const cyan    = "\033[0;36m";
}

coverage_result measure(
    std::string const& path,
    std::vector<std::string> const& lines,
    line_set covered_lines,
    report_options const& opts)
  {
  coverage_result r;
  r.path = path;
  r.classes = classify(lines);
  r.total_lines = r.classes.total_lines;
  r.code_lines = r.total_lines - static_cast<unsigned>(r.classes.blank_or_comment.size());

  BOOST_FOREACH(heredoc const& h, r.classes.heredocs)
    {
    if (!h.terminated)
      {
      Log::debug() << path << ":" << h.start << ": heredoc '" << h.terminator
                   << "' is never terminated; its body runs to the end of the file"
                   << std::endl;
      }
    }
  expand_heredocs(r.classes.heredocs, covered_lines);

  r.measurable = r.classes.measurable();
  r.ignored = r.classes.ignored;

  line_set denominator;
  if (opts.ignored_lowers_percent)
    {
    denominator = r.measurable | r.ignored;
    r.covered = covered_lines & r.measurable;
    }
  else
    {
    denominator = r.measurable - r.ignored;
    r.covered = covered_lines & denominator;
    }
  r.uncovered = r.measurable - r.ignored - r.covered;

  r.percent = denominator.empty()
    ? 100
    : static_cast<unsigned>(r.covered.size() * 100 / denominator.size());
  r.meets_minimum = r.percent >= opts.minimum_percent;
  return r;
  }

coverage_result measure_file(
    std::string const& path, file_hits const* hits, report_options const& opts)
  {
  try
    {
    source_file const file(path);
    return measure(path, file.lines(), hits ? hits->covered_lines() : line_set(), opts);
    }
  catch (std::runtime_error const& error)
    {
    Log::error() << error.what() << std::endl;
    coverage_result r;
    r.path = path;
    r.error = error.what();
    r.percent = 0;
    r.meets_minimum = false;
    return r;
    }
  }

coverage_report::coverage_report(report_options const& opts)
    : opts_(opts)
  {
  }

void coverage_report::add(coverage_result result)
  {
  results_.push_back(std::move(result));
  }

bool coverage_report::all_met_minimum() const
  {
  BOOST_FOREACH(coverage_result const& r, results_)
    {
    if (!r.meets_minimum)
      return false;
    }
  return true;
  }

bool coverage_report::any_errors() const
  {
  BOOST_FOREACH(coverage_result const& r, results_)
    {
    if (!r.ok())
      return true;
    }
  return false;
  }

void coverage_report::print(std::ostream& os) const
  {
  char const* const on = opts_.color ? magenta : "";
  char const* const off = opts_.color ? reset : "";
  os << "\n" << on << "[critic] Coverage Report" << off << std::endl;

  BOOST_FOREACH(coverage_result const& r, results_)
    {
    print_result(os, r);
    }
  }

void coverage_report::print_result(std::ostream& os, coverage_result const& r) const
  {
  bool const color = opts_.color;
  char const* const off = color ? reset : "";

  os << "\n" << (color ? cyan : "") << r.path << off << std::endl;
  if (!r.ok())
    {
    os << "  " << (color ? red : "") << "error: " << r.error << off << "\n" << std::endl;
    return;
    }

  os << "  Lines: " << r.total_lines << "\n"
     << "  " << (color ? magenta : "") << "Total LOC: " << r.code_lines << off << "\n"
     << "  " << (color ? green : "") << "Covered LOC: " << r.covered.size() << off << "\n"
     << "  " << (color ? yellow : "") << "Ignored LOC: " << r.ignored.size() << off << "\n"
     << "  " << (color ? (r.meets_minimum ? green : red) : "")
     << "Coverage %: " << r.percent;
  if (!r.meets_minimum)
    {
    os << " FAIL (minimum " << opts_.minimum_percent << "%)";
    }
  os << off << "\n"
     << "  Uncovered Lines: ";
  if (r.uncovered.empty())
    os << "none";
  else
    os << r.uncovered;
  os << "\n" << std::endl;

  if (!opts_.debug)
    return;

  os << "  Debug info\n\n"
     << "    # lines in file: " << r.total_lines << "\n"
     << "    # lines of code: " << r.code_lines << "\n"
     << "    Empty lines: " << r.classes.blank_or_comment << "\n"
     << "    Structural lines: " << r.classes.structural << "\n"
     << "    Ignored lines: " << r.ignored << "\n"
     << "    Covered lines: " << r.covered << "\n";
  BOOST_FOREACH(heredoc const& h, r.classes.heredocs)
    {
    os << "    Heredoc " << h.terminator << ": " << h.start << "-" << h.body_end
       << (h.terminated ? "" : " (unterminated)") << "\n";
    }
  os << std::endl;
  }

coverage_report report_coverage(
    symbol_registry const& symbols,
    trace_correlator const& trace,
    std::vector<std::string> const& extra_sources,
    report_options const& opts)
  {
  std::vector<std::string> const subject_files = symbols.subject_files();
  std::set<std::string> files(subject_files.begin(), subject_files.end());
  BOOST_FOREACH(std::string const& source, extra_sources)
    {
    if (symbols.is_excluded_file(source))
      {
      Log::warn() << source << " is the harness or the test file; not measured" << std::endl;
      continue;
      }
    files.insert(absolute_path(source, symbols.base_directory()));
    }

  for (auto const& traced : trace.files())
    {
    if (files.find(traced.first) == files.end())
      Log::debug() << traced.first << " was traced but declares nothing under test" << std::endl;
    }

  coverage_report report(opts);
  BOOST_FOREACH(std::string const& file, files)
    {
    Log::set_file(file);
    report.add(measure_file(file, trace.hits(file), opts));
    }
  Log::set_file(std::string());
  return report;
  }

}
