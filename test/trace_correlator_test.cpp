// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "trace_correlator.hpp"
#include "symbol_registry.hpp"
#include <boost/test/unit_test.hpp>
#include <sstream>

using namespace critic;

namespace
{
  struct registry_fixture
  {
    registry_fixture()
        : registry("/tmp/prelude.sh", "/work/test-lib.sh", "/work")
    {
        symbol_declaration s;
        s.name = "greet";
        s.line = 3;
        s.file = "/work/lib.sh";
        registry.declare(s);

        s.name = "test_greet";
        s.line = 2;
        s.file = "/work/test-lib.sh";
        registry.declare(s);
    }

    symbol_registry registry;
  };

  trace_event event(char const* file, unsigned line, char const* symbol = "")
  {
    trace_event e;
    e.file = file;
    e.line = line;
    e.symbol = symbol;
    return e;
  }

  line_set covered_after(unsigned line, unsigned times)
  {
    symbol_registry registry("prelude.sh", "test-lib.sh", "/work");
    trace_correlator trace(registry);
    for (unsigned i = 0; i < times; ++i)
      trace.consume(event("lib.sh", line));
    file_hits const* hits = trace.hits("/work/lib.sh");
    BOOST_REQUIRE(hits != 0);
    BOOST_CHECK_EQUAL(hits->line_hits.size(), times);
    return hits->covered_lines();
  }
}

BOOST_AUTO_TEST_CASE(a_line_hit_any_number_of_times_is_covered_once)
  {
  line_set const expected = { 7 };
  BOOST_CHECK(covered_after(7, 1) == expected);
  BOOST_CHECK(covered_after(7, 2) == expected);
  BOOST_CHECK(covered_after(7, 3) == expected);
  BOOST_CHECK(covered_after(7, 10) == expected);
  }

BOOST_FIXTURE_TEST_CASE(harness_and_spec_events_are_discarded, registry_fixture)
  {
  trace_correlator trace(registry);
  BOOST_CHECK(!trace.consume(event("/tmp/prelude.sh", 12)));
  BOOST_CHECK(!trace.consume(event("test-lib.sh", 5, "test_greet")));
  BOOST_CHECK(!trace.consume(event("/work/test-lib.sh", 6, "greet")));
  BOOST_CHECK(trace.consume(event("lib.sh", 4, "greet")));

  BOOST_CHECK_EQUAL(trace.events_discarded(), 3u);
  BOOST_CHECK_EQUAL(trace.events_kept(), 1u);
  BOOST_CHECK_EQUAL(trace.files().size(), 1u);
  BOOST_CHECK(trace.hits("/work/test-lib.sh") == 0);
  BOOST_CHECK(trace.hits("/tmp/prelude.sh") == 0);
  }

BOOST_FIXTURE_TEST_CASE(spellings_of_one_file_share_hits, registry_fixture)
  {
  trace_correlator trace(registry);
  trace.consume(event("lib.sh", 4, "greet"));
  trace.consume(event("./lib.sh", 5, "greet"));
  trace.consume(event("/work/lib.sh", 4, "greet"));

  file_hits const* hits = trace.hits("/work/lib.sh");
  BOOST_REQUIRE(hits != 0);
  line_set const expected = { 4, 5 };
  BOOST_CHECK(hits->covered_lines() == expected);
  }

BOOST_FIXTURE_TEST_CASE(only_subject_symbols_are_recorded, registry_fixture)
  {
  trace_correlator trace(registry);
  trace.consume(event("lib.sh", 4, "greet"));
  trace.consume(event("lib.sh", 9, "local_helper"));
  trace.consume(event("lib.sh", 11));

  file_hits const* hits = trace.hits("/work/lib.sh");
  BOOST_REQUIRE(hits != 0);
  BOOST_CHECK_EQUAL(hits->symbol_hits.size(), 1u);
  BOOST_CHECK(hits->symbol_hits.count("greet") == 1);
  BOOST_CHECK_EQUAL(hits->line_hits.size(), 3u);
  }

BOOST_FIXTURE_TEST_CASE(malformed_lines_change_nothing, registry_fixture)
  {
  std::string const log =
      "(test-lib.sh:3): source ./lib.sh\n"
      "(lib.sh:4):greet(): echo hello\n"
      "hello\n"
      "((lib.sh:5):greet(): return 0\n";

  trace_correlator clean(registry);
  std::istringstream clean_log(log);
  clean.consume(clean_log);

  trace_correlator noisy(registry);
  std::istringstream noisy_log(
      "garbage text with no structure\n" + log + "garbage text with no structure\n");
  noisy.consume(noisy_log);

  BOOST_CHECK_EQUAL(clean.lines_skipped(), 1u);
  BOOST_CHECK_EQUAL(noisy.lines_skipped(), 3u);
  BOOST_CHECK_EQUAL(clean.events_kept(), noisy.events_kept());
  BOOST_CHECK_EQUAL(clean.events_discarded(), noisy.events_discarded());

  file_hits const* a = clean.hits("/work/lib.sh");
  file_hits const* b = noisy.hits("/work/lib.sh");
  BOOST_REQUIRE(a != 0 && b != 0);
  BOOST_CHECK(a->covered_lines() == b->covered_lines());
  BOOST_CHECK(a->symbol_hits == b->symbol_hits);
  }

BOOST_FIXTURE_TEST_CASE(missing_trace_file_throws, registry_fixture)
  {
  trace_correlator trace(registry);
  BOOST_CHECK_THROW(trace.consume_file("/nonexistent/critic/trace.log"), std::runtime_error);
  }
