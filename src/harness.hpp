// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_HARNESS_HPP
# define CRITIC_HARNESS_HPP

# include "scoped_file.hpp"
# include <stdexcept>
# include <string>

namespace critic
{

// Thrown once the test script has ended if critic itself was signalled
// while it ran.
class interrupted : public std::runtime_error
{
 public:
    explicit interrupted(int signo);

    int signal() const { return signo_; }

 private:
    int signo_;
};

// Runs a test script under bash with xtrace routed into a trace file.
//
// The harness writes a small prelude script that opens the trace file
// on a spare descriptor, sets PS4 to the format parse_trace_line
// understands, turns on `set -o functrace -x`, arranges for the
// declared functions to be dumped on exit, and finally sources the test
// script.  The prelude is the "harness file" whose own trace lines and
// functions are excluded from coverage.
class harness
{
 public:
    // trace_path must name an existing (normally empty) file.  With
    // tracing off the script is still run, just not traced.
    harness(std::string const& test_file, std::string const& trace_path,
            bool tracing, bool retain_files);

    // Returns the exit status of the test script.  Throws
    // std::runtime_error if bash cannot be found or started, and
    // interrupted if critic receives SIGINT, SIGQUIT, SIGTERM or SIGHUP
    // meanwhile.
    int run();

    std::string const& prelude_path() const { return prelude_.path(); }
    std::string const& symbols_path() const { return symbols_.path(); }

    // The bash source of the prelude
    static std::string prelude_text();

 private:
    std::string test_file_;
    std::string trace_path_;
    bool tracing_;
    scoped_file prelude_;
    scoped_file symbols_;
};

}

#endif // CRITIC_HARNESS_HPP
