// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "harness.hpp"
#include "parse_trace.hpp"
#include "file_identity.hpp"
#include "log.hpp"

#include <boost/process.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>
#include <signal.h>
#include <stdexcept>
#include <system_error>

namespace bp = boost::process;

namespace critic
{

harness::harness(std::string const& test_file, std::string const& trace_path,
                 bool tracing, bool retain_files)
    : test_file_(test_file)
    , trace_path_(absolute_path(trace_path))
    , tracing_(tracing)
    , prelude_(absolute_path(scoped_file::unique_path(".critic-prelude-%%%%-%%%%.sh")), retain_files)
    , symbols_(absolute_path(scoped_file::unique_path(".critic-symbols-%%%%-%%%%.txt")), retain_files)
{}

std::string harness::prelude_text()
{
    return std::string()
        + "# Generated by critic. Runs the test script given as $1 with xtrace on.\n"
        + "if (( BASH_VERSINFO[0] < 4 || (BASH_VERSINFO[0] == 4 && BASH_VERSINFO[1] < 1) )); then\n"
        + "    echo \"critic needs bash version >= 4.1\" >&2\n"
        + "    exit 99\n"
        + "fi\n"
        + "\n"
        + "__critic_dump_symbols() {\n"
        + "    set +o xtrace +o functrace\n"
        + "    shopt -s extdebug\n"
        + "    local __critic_name\n"
        + "    for __critic_name in $(compgen -A function); do\n"
        + "        declare -F \"$__critic_name\"\n"
        + "    done > \"$CRITIC_SYMBOLS_FILE\"\n"
        + "}\n"
        + "trap __critic_dump_symbols EXIT\n"
        + "\n"
        + "if [ -n \"${CRITIC_TRACE_FILE:-}\" ]; then\n"
        + "    exec {__critic_trace_fd}>>\"$CRITIC_TRACE_FILE\"\n"
        + "    BASH_XTRACEFD=$__critic_trace_fd\n"
        + "    PS4='" + trace_prompt + "'\n"
        + "    set -o functrace -o xtrace\n"
        + "fi\n"
        + "\n"
        + "__critic_test_file=$1\n"
        + "shift\n"
        + "case $__critic_test_file in\n"
        + "    */*) ;;\n"
        + "    *) __critic_test_file=./$__critic_test_file ;;\n"
        + "esac\n"
        + "source \"$__critic_test_file\"\n";
}

namespace
{
  // Active in the parent while the test script runs.  SIGINT and SIGQUIT
  // reach the script from the terminal by themselves; SIGTERM and SIGHUP
  // are passed on to it.  Either way the run unwinds once the script is
  // gone.
  struct forward_signals
  {
      boost::asio::signal_set& signals;
      bp::child& child;
      int& received;

      void operator()(boost::system::error_code const& ec, int signo) const
      {
          if (ec)
              return;

          Log::debug() << "received signal " << signo << std::endl;
          received = signo;
          if (signo == SIGTERM || signo == SIGHUP)
              ::kill(child.id(), signo);
          signals.async_wait(*this);
      }
  };
}

interrupted::interrupted(int signo)
    : std::runtime_error("interrupted by signal " + boost::lexical_cast<std::string>(signo))
    , signo_(signo)
{}

int harness::run()
{
    boost::filesystem::path const bash = bp::search_path("bash");
    if (bash.empty())
    {
        throw std::runtime_error("cannot find bash in PATH");
    }

    prelude_.write(prelude_text());

    bp::environment env = boost::this_process::environment();
    env["CRITIC_SYMBOLS_FILE"] = symbols_.path();
    if (tracing_)
        env["CRITIC_TRACE_FILE"] = trace_path_;
    else
        env.erase("CRITIC_TRACE_FILE");

    Log::info() << "Running tests in " << test_file_ << std::endl;
    Log::debug() << bash.generic_string() << " " << prelude_.path() << " " << test_file_ << std::endl;

    boost::asio::io_context ios;
    boost::asio::signal_set signals(ios, SIGINT, SIGQUIT);
    signals.add(SIGTERM);
    signals.add(SIGHUP);

    int status = -1;
    int received = 0;
    std::error_code wait_error;
    try
    {
        bp::child child(
            bash, prelude_.path(), test_file_, env, ios,
            bp::on_exit([&](int code, std::error_code const& ec)
                {
                    status = code;
                    wait_error = ec;
                    signals.cancel();
                }));
        signals.async_wait(forward_signals{ signals, child, received });
        ios.run();
    }
    catch (bp::process_error const& error)
    {
        throw std::runtime_error("cannot run " + test_file_ + ": " + error.what());
    }

    if (received != 0)
    {
        throw interrupted(received);
    }
    if (wait_error)
    {
        throw std::runtime_error("lost track of " + test_file_ + ": " + wait_error.message());
    }
    return status;
}

}
