// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "symbol_registry.hpp"
#include "file_identity.hpp"
#include <boost/test/unit_test.hpp>
#include <sstream>

using namespace critic;

namespace
{
  symbol_declaration declaration(char const* name, unsigned line, char const* file)
  {
    symbol_declaration s;
    s.name = name;
    s.line = line;
    s.file = file;
    return s;
  }
}

BOOST_AUTO_TEST_CASE(read_symbols_understands_declare_output)
  {
  std::istringstream in(
      "greet 3 /work/lib.sh\n"
      "with_spaces 12 /work/my dir/lib.sh\n"
      "declare -f from_eval\n"
      "\n"
      "this is not a declaration\n"
      "helper 7 test-lib.sh\n");
  std::vector<symbol_declaration> symbols = read_symbols(in);
  BOOST_REQUIRE_EQUAL(symbols.size(), 4u);

  BOOST_CHECK_EQUAL(symbols[0].name, "greet");
  BOOST_CHECK_EQUAL(symbols[0].line, 3u);
  BOOST_CHECK_EQUAL(symbols[0].file, "/work/lib.sh");
  BOOST_CHECK(is_resolved(symbols[0]));

  BOOST_CHECK_EQUAL(symbols[1].file, "/work/my dir/lib.sh");

  BOOST_CHECK_EQUAL(symbols[2].name, "from_eval");
  BOOST_CHECK_EQUAL(symbols[2].line, 0u);
  BOOST_CHECK(symbols[2].file.empty());
  BOOST_CHECK(!is_resolved(symbols[2]));

  BOOST_CHECK_EQUAL(symbols[3].name, "helper");
  BOOST_CHECK_EQUAL(symbols[3].file, "test-lib.sh");
  }

BOOST_AUTO_TEST_CASE(read_symbols_file_reports_missing_file)
  {
  BOOST_CHECK_THROW(read_symbols_file("/nonexistent/critic/symbols.txt"), std::runtime_error);
  }

BOOST_AUTO_TEST_CASE(redeclaring_a_name_replaces_it)
  {
  symbol_registry registry("/tmp/prelude.sh", "/work/test-lib.sh");
  registry.declare(declaration("greet", 3, "/work/old.sh"));
  registry.declare(declaration("greet", 9, "/work/lib.sh"));
  BOOST_CHECK_EQUAL(registry.size(), 1u);

  symbol_declaration const* s = registry.find("greet");
  BOOST_REQUIRE(s != 0);
  BOOST_CHECK_EQUAL(s->line, 9u);
  BOOST_CHECK_EQUAL(s->file, "/work/lib.sh");
  BOOST_CHECK(registry.find("missing") == 0);
  }

BOOST_AUTO_TEST_CASE(subject_symbols_leave_out_harness_spec_and_unresolved)
  {
  symbol_registry registry("/tmp/.critic-prelude-1234.sh", "test-lib.sh");
  std::vector<symbol_declaration> symbols;
  symbols.push_back(declaration("greet", 3, "/work/lib.sh"));
  symbols.push_back(declaration("farewell", 10, "/work/lib.sh"));
  symbols.push_back(declaration("util", 1, "/work/util.sh"));
  symbols.push_back(declaration("__critic_dump_symbols", 7, "/tmp/.critic-prelude-1234.sh"));
  symbols.push_back(declaration("test_greet", 2, "/work/test-lib.sh"));
  symbols.push_back(declaration("from_eval", 0, ""));
  registry.declare_all(symbols);

  BOOST_CHECK(registry.is_subject("greet"));
  BOOST_CHECK(registry.is_subject("util"));
  BOOST_CHECK(!registry.is_subject("__critic_dump_symbols"));
  BOOST_CHECK(!registry.is_subject("test_greet"));
  BOOST_CHECK(!registry.is_subject("from_eval"));
  BOOST_CHECK(!registry.is_subject("never_declared"));

  std::set<std::string> expected_symbols;
  expected_symbols.insert("farewell");
  expected_symbols.insert("greet");
  expected_symbols.insert("util");
  BOOST_CHECK(registry.subject_symbols() == expected_symbols);

  std::vector<std::string> files = registry.subject_files();
  BOOST_REQUIRE_EQUAL(files.size(), 2u);
  BOOST_CHECK_EQUAL(files[0], "/work/lib.sh");
  BOOST_CHECK_EQUAL(files[1], "/work/util.sh");
  }

BOOST_AUTO_TEST_CASE(excluded_files_match_by_name)
  {
  symbol_registry registry("/tmp/prelude.sh", "/work/test-lib.sh");
  BOOST_CHECK(registry.is_excluded_file("/tmp/prelude.sh"));
  BOOST_CHECK(registry.is_excluded_file("test-lib.sh"));
  BOOST_CHECK(registry.is_excluded_file("./sub/test-lib.sh"));
  BOOST_CHECK(!registry.is_excluded_file("/work/lib.sh"));
  }

BOOST_AUTO_TEST_CASE(subject_files_resolve_against_base_directory)
  {
  symbol_registry registry("prelude.sh", "test-lib.sh", "/work/project");
  registry.declare(declaration("greet", 3, "./lib/../lib.sh"));
  std::vector<std::string> files = registry.subject_files();
  BOOST_REQUIRE_EQUAL(files.size(), 1u);
  BOOST_CHECK_EQUAL(files[0], "/work/project/lib.sh");
  BOOST_CHECK_EQUAL(absolute_path("lib.sh", "/work/project"), "/work/project/lib.sh");
  }
