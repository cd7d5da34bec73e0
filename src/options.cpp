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

#include "options.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <stdexcept>

Options::Options()
    : coverage_enabled(true)
    , minimum_percent(0)
    , retain_trace_on_debug(false)
    , ignored_lowers_percent(true)
    , debug(false)
    , color(true)
    , strict(false)
    , consume_trace(false)
  {
  }

critic::report_options Options::report() const
  {
  critic::report_options r;
  r.minimum_percent = minimum_percent;
  r.ignored_lowers_percent = ignored_lowers_percent;
  r.color = color;
  r.debug = debug;
  return r;
  }

namespace critic
{

unsigned checked_percent(int value)
  {
  if (value < 0 || value > 100)
    {
    throw std::runtime_error(
        "minimum coverage percent must be between 0 and 100, not "
        + boost::lexical_cast<std::string>(value));
    }
  return static_cast<unsigned>(value);
  }

// Leaves value alone if the key is absent; throws ptree_bad_data if the
// text does not convert
template <class T>
static void read_value(boost::property_tree::ptree const& tree, char const* key, T& value)
  {
  if (boost::optional<boost::property_tree::ptree const&> child = tree.get_child_optional(key))
    {
    value = child->get_value<T>();
    }
  }

void read_config(std::istream& in, Options& o, std::string const& filename)
  {
  boost::property_tree::ptree tree;
  try
    {
    boost::property_tree::read_ini(in, tree);
    read_value(tree, "coverage.enabled", o.coverage_enabled);
    int percent = static_cast<int>(o.minimum_percent);
    read_value(tree, "coverage.minimumPercent", percent);
    o.minimum_percent = checked_percent(percent);
    read_value(tree, "coverage.retainTraceOnDebug", o.retain_trace_on_debug);
    read_value(tree, "coverage.ignoredLowersPercent", o.ignored_lowers_percent);
    }
  catch (boost::property_tree::ini_parser_error const& error)
    {
    throw std::runtime_error(
        filename + ":" + boost::lexical_cast<std::string>(error.line())
        + ": error: " + error.message());
    }
  catch (boost::property_tree::ptree_error const& error)
    {
    throw std::runtime_error(filename + ": error: " + error.what());
    }
  catch (std::runtime_error const& error)
    {
    throw std::runtime_error(filename + ": error: " + error.what());
    }
  }

void read_config_file(std::string const& filename, Options& o)
  {
  std::ifstream file(filename.c_str());
  if (!file)
    {
    throw std::runtime_error("cannot read configuration: " + filename);
    }
  read_config(file, o, filename);
  }

std::string environment_option(std::string const& variable)
  {
  if (variable == "CRITIC_COVERAGE_DISABLE")
    return "no-coverage";
  if (variable == "CRITIC_COVERAGE_MIN_PERCENT")
    return "min-percent";
  if (variable == "CRITIC_RETAIN_TRACE")
    return "retain-trace";
  if (variable == "DEBUG")
    return "debug";
  return "";
  }

static bool is_set(boost::program_options::variables_map const& vars, char const* name)
  {
  return vars.count(name) && !vars[name].as<std::string>().empty();
  }

void apply_environment(boost::program_options::variables_map const& vars, Options& o)
  {
  if (is_set(vars, "no-coverage"))
    {
    o.coverage_enabled = false;
    }
  if (is_set(vars, "min-percent"))
    {
    std::string const value = vars["min-percent"].as<std::string>();
    try
      {
      o.minimum_percent = checked_percent(boost::lexical_cast<int>(value));
      }
    catch (boost::bad_lexical_cast const&)
      {
      throw std::runtime_error("CRITIC_COVERAGE_MIN_PERCENT is not a number: " + value);
      }
    }
  if (is_set(vars, "retain-trace"))
    {
    o.retain_trace_on_debug = true;
    }
  if (is_set(vars, "debug"))
    {
    o.debug = true;
    }
  }

} // namespace critic
