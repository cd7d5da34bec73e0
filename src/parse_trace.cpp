// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "parse_trace.hpp"

#include <boost/spirit/include/qi.hpp>

namespace qi = boost::spirit::qi;

namespace critic
{

char const* const trace_prompt
    = "(${BASH_SOURCE}:${LINENO}):${FUNCNAME[0]:+${FUNCNAME[0]}():}";

template<typename Iterator>
struct TraceGrammar: qi::grammar<Iterator, trace_event()>
  {
  TraceGrammar() : TraceGrammar::base_type(event_)
    {
    // bash repeats the first character of PS4 once per level of
    // indirection, so nested calls start with several '('
    event_
     %= +qi::lit('(')
      >> file_
      >> ':'
      >> qi::uint_
      >> ')'
      >> ':'
      >> symbol_
      >> args_
      ;
    file_
     %= +(qi::char_ - qi::char_(":()"))
      ;
    symbol_
     %= qi::hold[name_ >> "():"]
      | qi::attr(std::string())
      ;
    // bash allows ':' in function names, so a name ends only at "():"
    name_
     %= +(qi::char_ - qi::char_("()") - qi::space)
      ;
    args_
     %= *qi::char_
      ;
    }
  qi::rule<Iterator, trace_event()> event_;
  qi::rule<Iterator, std::string()> file_, symbol_, name_, args_;
  };

boost::optional<trace_event> parse_trace_line(std::string const& line)
  {
  typedef std::string::const_iterator Iterator;
  static TraceGrammar<Iterator> const grammar;

  trace_event event;
  event.line = 0;
  Iterator first = line.begin(), last = line.end();
  if (!qi::parse(first, last, grammar, event) || first != last)
    {
    return boost::none;
    }
  return event;
  }

} // namespace critic
