// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CRITIC_SYMBOL_REGISTRY_HPP
# define CRITIC_SYMBOL_REGISTRY_HPP

# include <boost/fusion/adapted/struct/define_struct.hpp>
# include <boost/unordered_map.hpp>
# include <istream>
# include <set>
# include <string>
# include <vector>

// Field order follows `shopt -s extdebug; declare -F name`, which
// prints "name line file".
BOOST_FUSION_DEFINE_STRUCT((critic), symbol_declaration,
  (std::string, name)
  (unsigned, line)
  (std::string, file)
  )

namespace critic
{

// A declaration whose file or line bash could not tell us
inline bool is_resolved(symbol_declaration const& s)
  {
  return !s.file.empty() && s.line > 0;
  }

// Reads one declaration per line.  Lines of the form "declare -f name"
// yield unresolved declarations; anything else that does not parse is
// skipped.
std::vector<symbol_declaration> read_symbols(std::istream& in);

// Throws std::runtime_error if the file cannot be read
std::vector<symbol_declaration> read_symbols_file(std::string const& filename);

// The functions declared in the traced shell, split into those under
// test ("subject" symbols) and those belonging to the harness or the
// test specification.
class symbol_registry
  {
  public:
    symbol_registry(
        std::string const& harness_file,
        std::string const& spec_file,
        std::string const& base_directory = std::string());

    // Re-declaring a name replaces the earlier declaration
    void declare(symbol_declaration const& s);

    template <class Range>
    void declare_all(Range const& declarations)
      {
      for (auto const& s : declarations)
        declare(s);
      }

    // Null if the name was never declared
    symbol_declaration const* find(std::string const& name) const;

    bool is_subject(std::string const& name) const;

    // True for the harness and the test specification
    bool is_excluded_file(std::string const& file) const;

    std::set<std::string> subject_symbols() const;

    // Absolute paths of the files declaring subject symbols, sorted
    std::vector<std::string> subject_files() const;

    std::string const& base_directory() const
      {
      return base_directory_;
      }
    std::size_t size() const
      {
      return symbols_.size();
      }

  private:
    bool is_subject_declaration(symbol_declaration const& s) const;

  private:
    std::string harness_name_;
    std::string spec_name_;
    std::string base_directory_;
    boost::unordered_map<std::string, symbol_declaration> symbols_;
  };

} // namespace critic

#endif // CRITIC_SYMBOL_REGISTRY_HPP
