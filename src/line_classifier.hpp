// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_LINE_CLASSIFIER_HPP
# define CRITIC_LINE_CLASSIFIER_HPP

# include "line_set.hpp"
# include <string>
# include <vector>

namespace critic
{

struct heredoc
{
    unsigned start;          // line holding the << redirection
    std::string terminator;  // marker that closes the body
    unsigned body_end;       // terminator line, or the last line if unterminated
    bool strip_tabs;         // <<- form
    bool terminated;
};

// Static classification of a script's lines.  The sets are computed
// independently of each other and may overlap.
struct line_classes
{
    line_classes() : total_lines(0) {}

    unsigned total_lines;
    line_set blank_or_comment;
    line_set structural;
    line_set ignored;
    std::vector<heredoc> heredocs;

    // Lines that count toward coverage
    line_set measurable() const;
};

// The individual passes.  Each is a pure function of the lines.
line_set blank_or_comment_lines(std::vector<std::string> const& lines);
line_set structural_lines(std::vector<std::string> const& lines);
line_set ignored_lines(std::vector<std::string> const& lines);
std::vector<heredoc> find_heredocs(std::vector<std::string> const& lines);

line_classes classify(std::vector<std::string> const& lines);

bool is_function_header(std::string const& line);

}

#endif // CRITIC_LINE_CLASSIFIER_HPP
