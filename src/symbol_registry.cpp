// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "symbol_registry.hpp"
#include "file_identity.hpp"
#include "log.hpp"

#include <boost/spirit/include/qi.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <stdexcept>

namespace qi = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;

namespace critic
{

std::vector<symbol_declaration> read_symbols(std::istream& in)
  {
  std::vector<symbol_declaration> result;
  std::string line;
  unsigned line_no = 0;
  while (std::getline(in, line))
    {
    ++line_no;
    symbol_declaration s;
    s.line = 0;

    std::string::const_iterator first = line.begin(), last = line.end();
    if (qi::phrase_parse(first, last,
          qi::lexeme[+ascii::graph] >> qi::uint_ >> qi::lexeme[+qi::char_] >> qi::eoi,
          ascii::blank, s))
      {
      boost::trim(s.file);
      result.push_back(s);
      continue;
      }

    // Output of a plain `declare -F`: the name without provenance
    s = symbol_declaration();
    s.line = 0;
    first = line.begin();
    if (qi::phrase_parse(first, last,
          qi::lit("declare") >> qi::omit[qi::lexeme['-' >> +ascii::alpha]]
          >> qi::lexeme[+ascii::graph] >> qi::eoi,
          ascii::blank, s.name))
      {
      result.push_back(s);
      continue;
      }

    if (!boost::trim_copy(line).empty())
      {
      Log::trace() << "symbols:" << line_no << ": skipping '" << line << "'" << std::endl;
      }
    }
  return result;
  }

std::vector<symbol_declaration> read_symbols_file(std::string const& filename)
  {
  std::ifstream file(filename.c_str());
  if (!file)
    {
    throw std::runtime_error("cannot read symbol list: " + filename);
    }
  return read_symbols(file);
  }

symbol_registry::symbol_registry(
    std::string const& harness_file,
    std::string const& spec_file,
    std::string const& base_directory)
    : harness_name_(file_name(harness_file))
    , spec_name_(file_name(spec_file))
    , base_directory_(base_directory)
  {
  }

void symbol_registry::declare(symbol_declaration const& s)
  {
  symbols_[s.name] = s;
  }

symbol_declaration const* symbol_registry::find(std::string const& name) const
  {
  auto it = symbols_.find(name);
  return it == symbols_.end() ? 0 : &it->second;
  }

bool symbol_registry::is_excluded_file(std::string const& file) const
  {
  std::string const name = file_name(file);
  return name == harness_name_ || name == spec_name_;
  }

bool symbol_registry::is_subject_declaration(symbol_declaration const& s) const
  {
  return is_resolved(s) && !is_excluded_file(s.file);
  }

bool symbol_registry::is_subject(std::string const& name) const
  {
  symbol_declaration const* s = find(name);
  return s && is_subject_declaration(*s);
  }

std::set<std::string> symbol_registry::subject_symbols() const
  {
  std::set<std::string> result;
  for (auto const& entry : symbols_)
    {
    if (is_subject_declaration(entry.second))
      result.insert(entry.first);
    }
  return result;
  }

std::vector<std::string> symbol_registry::subject_files() const
  {
  std::set<std::string> files;
  for (auto const& entry : symbols_)
    {
    if (is_subject_declaration(entry.second))
      files.insert(absolute_path(entry.second.file, base_directory_));
    }
  return std::vector<std::string>(files.begin(), files.end());
  }

} // namespace critic
