/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef CRITIC_OPTIONS_HPP
#define CRITIC_OPTIONS_HPP

#include "coverage.hpp"
#include <boost/program_options/variables_map.hpp>
#include <istream>
#include <string>
#include <vector>

struct Options
  {
  Options();

  // [coverage] section of the config file
  bool coverage_enabled;
  unsigned minimum_percent;
  bool retain_trace_on_debug;
  bool ignored_lowers_percent;

  bool debug;
  bool color;
  bool strict;
  bool consume_trace;

  std::string config_file;
  std::string trace_file;
  std::string symbols_file;
  std::string harness_file;
  std::string spec_file;
  std::string base_directory;
  std::string test_file;
  std::vector<std::string> sources;

  bool retain_trace() const
    {
    return retain_trace_on_debug && debug;
    }

  critic::report_options report() const;
  };

extern Options options;

namespace critic
{

// Throws std::runtime_error unless 0 <= value <= 100
unsigned checked_percent(int value);

// Reads the [coverage] keys (enabled, minimumPercent,
// retainTraceOnDebug, ignoredLowersPercent) over the current values.
// Throws std::runtime_error naming the file on a format or value error.
void read_config(std::istream& in, Options& o, std::string const& filename = "<config>");
void read_config_file(std::string const& filename, Options& o);

// Name mapper for boost::program_options::parse_environment: the option
// a recognized environment variable sets, or "" to ignore it
std::string environment_option(std::string const& variable);

// Applies the variables picked up by environment_option.  A variable
// that is set to anything non-empty turns its switch on.
void apply_environment(boost::program_options::variables_map const& vars, Options& o);

} // namespace critic

#endif /* CRITIC_OPTIONS_HPP */
