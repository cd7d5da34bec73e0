/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
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

#include <boost/program_options.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/scoped_ptr.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "coverage.hpp"
#include "harness.hpp"
#include "log.hpp"
#include "options.hpp"
#include "scoped_file.hpp"
#include "symbol_registry.hpp"
#include "trace_correlator.hpp"

Options options;

static int report_status(critic::coverage_report const& report)
{
    if (report.any_errors())
    {
        return EXIT_FAILURE;
    }
    if (options.strict && !report.all_met_minimum())
    {
        Log::error() << "coverage is below the minimum of "
                     << options.minimum_percent << "%" << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

static int report_trace(critic::symbol_registry const& symbols, std::string const& trace_file)
{
    critic::trace_correlator trace(symbols);
    trace.consume_file(trace_file);

    critic::coverage_report report =
        critic::report_coverage(symbols, trace, options.sources, options.report());
    report.print(std::cout);
    return report_status(report);
}

// critic test-foo.sh
static int run_tests()
{
    critic::scoped_file trace(
        critic::scoped_file::unique_path(".critic-trace-%%%%-%%%%.log"),
        options.retain_trace());
    trace.create();

    critic::harness harness(
        options.test_file, trace.path(), options.coverage_enabled, options.retain_trace());
    int const status = harness.run();

    int result = EXIT_SUCCESS;
    if (options.coverage_enabled)
    {
        if (!boost::filesystem::exists(harness.symbols_path()))
        {
            Log::warn() << options.test_file
                        << " ended without listing its functions; no coverage report"
                        << std::endl;
        }
        else
        {
            critic::symbol_registry symbols(harness.prelude_path(), options.test_file);
            symbols.declare_all(critic::read_symbols_file(harness.symbols_path()));
            result = report_trace(symbols, trace.path());
        }
    }
    return status != 0 ? status : result;
}

// critic --trace FILE --symbols FILE --harness NAME --spec NAME
static int report_artifacts()
{
    if (options.trace_file.empty() || options.symbols_file.empty())
    {
        throw std::runtime_error("--trace and --symbols are required without a test file");
    }

    boost::scoped_ptr<critic::scoped_file> owned_trace;
    if (options.consume_trace)
    {
        owned_trace.reset(new critic::scoped_file(options.trace_file, options.retain_trace()));
    }

    critic::symbol_registry symbols(
        options.harness_file, options.spec_file, options.base_directory);
    symbols.declare_all(critic::read_symbols_file(options.symbols_file));
    Log::debug() << symbols.size() << " functions declared, "
                 << symbols.subject_symbols().size() << " under test" << std::endl;

    if (!options.coverage_enabled)
    {
        return EXIT_SUCCESS;
    }
    return report_trace(symbols, options.trace_file);
}

int main(int argc, char **argv)
{
    bool exit_success = false;
    int result = EXIT_SUCCESS;
    try
    {
        namespace po = boost::program_options;
        po::options_description program_options("Allowed options");
        program_options.add_options()
            ("help,h", "produce help message")
            ("version,v", "print version string")
            ("quiet,q", "be quiet")
            ("verbose,V", "be verbose")
            ("extra-verbose,X", "be even more verbose")
            ("debug", "print per-file debug info; keeps the trace with --retain-trace")
            ("exit-success", "exit with 0, even if errors occured")
            ("config", po::value(&options.config_file)->value_name("FILENAME"), "ini file with a [coverage] section")
            ("no-coverage", "run without collecting coverage")
            ("min-percent", po::value<int>()->value_name("PERCENT"), "minimum acceptable coverage per file")
            ("strict", "exit with failure when a file is below the minimum")
            ("retain-trace", "keep the trace file when debugging")
            ("exclude-ignored", "leave ignored lines out of the percentage too")
            ("no-color", "plain report without ANSI colors")
            ("trace", po::value(&options.trace_file)->value_name("FILENAME"), "existing trace log to report on")
            ("symbols", po::value(&options.symbols_file)->value_name("FILENAME"), "declared functions, as printed by `declare -F name` with extdebug")
            ("harness", po::value(&options.harness_file)->value_name("NAME"), "harness file, excluded from coverage")
            ("spec", po::value(&options.spec_file)->value_name("NAME"), "test file, excluded from coverage")
            ("source", po::value(&options.sources)->value_name("FILENAME"), "also measure this file")
            ("base-dir", po::value(&options.base_directory)->value_name("PATH"), "directory relative trace paths are resolved against")
            ("consume-trace", "delete the trace file after reporting")
            ("test-file", po::value(&options.test_file)->value_name("FILENAME"), "test script to run")
            ;
        po::positional_options_description positional;
        positional.add("test-file", 1);

        po::variables_map variables;
        store(po::command_line_parser(argc, argv)
              .options(program_options)
              .positional(positional)
              .run(), variables);
        if (variables.count("help"))
        {
            std::cout << "Usage: critic [options] test-file.sh\n"
                      << "       critic [options] --trace FILE --symbols FILE --harness NAME --spec NAME\n\n"
                      << program_options << std::endl;
            return 0;
        }
        if (variables.count("version"))
        {
            std::cout << "critic 0.1" << std::endl;
            return 0;
        }
        notify(variables);

        // config file, then environment, then command line
        if (!options.config_file.empty())
        {
            critic::read_config_file(options.config_file, options);
        }

        po::options_description environment;
        environment.add_options()
            ("no-coverage", po::value<std::string>())
            ("min-percent", po::value<std::string>())
            ("retain-trace", po::value<std::string>())
            ("debug", po::value<std::string>())
            ;
        po::variables_map environment_variables;
        store(po::parse_environment(environment, critic::environment_option), environment_variables);
        notify(environment_variables);
        critic::apply_environment(environment_variables, options);

        if (variables.count("quiet"))
        {
            Log::set_level(Log::Warning);
        }
        if (variables.count("verbose"))
        {
            Log::set_level(Log::Debug);
        }
        if (variables.count("extra-verbose"))
        {
            Log::set_level(Log::Trace);
        }
        if (variables.count("exit-success"))
        {
            exit_success = true;
        }
        if (variables.count("no-coverage"))
        {
            options.coverage_enabled = false;
        }
        if (variables.count("min-percent"))
        {
            options.minimum_percent = critic::checked_percent(variables["min-percent"].as<int>());
        }
        if (variables.count("debug"))
        {
            options.debug = true;
        }
        options.retain_trace_on_debug |= variables.count("retain-trace") > 0;
        options.ignored_lowers_percent &= variables.count("exclude-ignored") == 0;
        options.color = variables.count("no-color") == 0;
        options.strict = variables.count("strict") > 0;
        options.consume_trace = variables.count("consume-trace") > 0;
        if (options.debug && Log::level() < Log::Debug)
        {
            Log::set_level(Log::Debug);
        }

        result = options.test_file.empty() ? report_artifacts() : run_tests();
    }
    catch (critic::interrupted const& error)
    {
        Log::warn() << error.what() << std::endl;
        return 128 + error.signal();
    }
    catch (std::exception const& error)
    {
        Log::error() << error.what() << "\n\n";
        return EXIT_FAILURE;
    }
    int const log_result = Log::result();
    if (exit_success)
    {
        return EXIT_SUCCESS;
    }
    return result != EXIT_SUCCESS ? result : log_result;
}
