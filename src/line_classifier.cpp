// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "line_classifier.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>
#include <cctype>

namespace critic
{

// name() {   function name {   function name() {
static boost::regex const function_header(
    "\\s*(?:function\\s+[^\\s(){}=]+(?:\\s*\\(\\s*\\))?|[^\\s(){}=]+\\s*\\(\\s*\\))\\s*\\{\\s*");

static boost::regex const closing_brace("\\s*\\}\\s*");

static boost::regex const ignore_open("#\\s*critic\\s+ignore\\b");
static boost::regex const ignore_close("#\\s*critic\\s+/ignore\\b");

// <<EOF  <<-EOF  << 'EOF'  <<"EOF"  <<\EOF
static boost::regex const heredoc_redirection(
    "<<(-?)[ \\t]*\\\\?(['\"]?)([A-Za-z_][A-Za-z0-9_]*)\\2");

static bool is_comment(std::string const& line)
{
    return boost::starts_with(boost::trim_left_copy(line), "#");
}

bool is_function_header(std::string const& line)
{
    return boost::regex_match(line, function_header);
}

line_set line_classes::measurable() const
{
    return all_lines(total_lines) - blank_or_comment - structural;
}

line_set blank_or_comment_lines(std::vector<std::string> const& lines)
{
    line_set result;
    for (unsigned i = 0; i < lines.size(); ++i)
    {
        std::string const stripped = boost::trim_left_copy(lines[i]);
        if (stripped.empty() || stripped[0] == '#')
            result.insert(result.end(), i + 1);
    }
    return result;
}

line_set structural_lines(std::vector<std::string> const& lines)
{
    line_set result;
    for (unsigned i = 0; i < lines.size(); ++i)
    {
        if (is_function_header(lines[i]) || boost::regex_match(lines[i], closing_brace))
            result.insert(result.end(), i + 1);
    }
    return result;
}

line_set ignored_lines(std::vector<std::string> const& lines)
{
    line_set result;
    bool inside = false;
    for (unsigned i = 0; i < lines.size(); ++i)
    {
        std::string const& line = lines[i];
        if (!inside)
        {
            if (!boost::regex_search(line, ignore_open))
                continue;
            inside = true;
        }
        result.insert(result.end(), i + 1);
        if (boost::regex_search(line, ignore_close))
            inside = false;
    }
    return result;
}

// Marks the characters of line where a redirection can start: outside
// quotes, arithmetic (( )) and $(( )), and a trailing comment.
static std::vector<bool> redirection_positions(std::string const& line)
{
    std::vector<bool> result(line.size(), false);
    char quote = 0;
    unsigned arithmetic = 0;  // open parentheses inside (( ))
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char const c = line[i];
        if (quote == '\'')
        {
            if (c == '\'')
                quote = 0;
        }
        else if (quote == '"')
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                quote = 0;
        }
        else if (c == '\\')
        {
            ++i;
        }
        else if (c == '\'' || c == '"')
        {
            quote = c;
        }
        else if (arithmetic > 0)
        {
            if (c == '(')
                ++arithmetic;
            else if (c == ')')
                --arithmetic;
        }
        else if (c == '(' && i + 1 < line.size() && line[i + 1] == '(')
        {
            arithmetic = 2;
            ++i;
        }
        else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1]))))
        {
            break;
        }
        else
        {
            result[i] = true;
        }
    }
    return result;
}

// The first << on line that redirects from a heredoc
static bool find_redirection(std::string const& line, boost::smatch& match)
{
    std::vector<bool> const positions = redirection_positions(line);
    for (boost::sregex_iterator it(line.begin(), line.end(), heredoc_redirection), end;
         it != end; ++it)
    {
        std::size_t const at = static_cast<std::size_t>(it->position());
        if (!positions[at])
            continue;
        // here-string
        if (at > 0 && line[at - 1] == '<')
            continue;
        match = *it;
        return true;
    }
    return false;
}

std::vector<heredoc> find_heredocs(std::vector<std::string> const& lines)
{
    std::vector<heredoc> result;
    unsigned const n = static_cast<unsigned>(lines.size());
    for (unsigned i = 0; i < n; ++i)
    {
        std::string const& line = lines[i];
        if (is_comment(line))
            continue;

        boost::smatch match;
        if (!find_redirection(line, match))
            continue;

        heredoc h;
        h.start = i + 1;
        h.strip_tabs = match[1].length() > 0;
        h.terminator = match[3].str();
        h.body_end = n;
        h.terminated = false;

        for (unsigned j = i + 1; j < n; ++j)
        {
            std::string candidate = lines[j];
            if (h.strip_tabs)
                boost::trim_left_if(candidate, boost::is_any_of("\t"));
            if (candidate == h.terminator)
            {
                h.body_end = j + 1;
                h.terminated = true;
                break;
            }
        }
        result.push_back(h);

        // Nothing inside the body can open another heredoc
        i = h.body_end - 1;
    }
    return result;
}

line_classes classify(std::vector<std::string> const& lines)
{
    line_classes classes;
    classes.total_lines = static_cast<unsigned>(lines.size());
    classes.blank_or_comment = blank_or_comment_lines(lines);
    classes.structural = structural_lines(lines);
    classes.ignored = ignored_lines(lines);
    classes.heredocs = find_heredocs(lines);
    return classes;
}

}
