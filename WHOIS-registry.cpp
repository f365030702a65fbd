#include "WHOIS-registry.hpp"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

// One entry per line:
//
//   .com      whois.verisign-grs.com
//   .ad       -                       # no public server
//
// Blank lines and '#' comments are ignored.

namespace registry_file {
// clang-format off

struct blank     : one<' ', '\t'> {};

struct let_dig   : sor<ALPHA, DIGIT> {};

struct label     : seq<let_dig, star<sor<let_dig, one<'-'>>>> {};

struct suffix    : seq<one<'.'>, label> {};

struct server    : seq<let_dig, star<sor<let_dig, one<'-', '.'>>>> {};

struct no_server : seq<one<'-'>, at<sor<blank, one<'#'>, eolf>>> {};

struct entry     : seq<suffix, plus<blank>, sor<no_server, server>> {};

struct comment   : seq<one<'#'>, star<not_one<'\n'>>> {};

struct line      : seq<star<blank>, opt<entry>, star<blank>, opt<comment>, eolf> {};

struct file      : until<eof, must<line>> {};

// clang-format on
} // namespace registry_file

namespace WHOIS {

struct registry_builder {
  Registry&   reg;
  char const* source;

  std::string suffix;

  void add(Registry::server_t server, std::size_t line)
  {
    try {
      reg.insert_(suffix, std::move(server));
    }
    catch (std::invalid_argument const& ex) {
      throw std::invalid_argument(
          fmt::format("{}:{}: {}", source, line, ex.what()));
    }
  }
};

} // namespace WHOIS

namespace registry_file {

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<suffix> {
  template <typename Input>
  static void apply(Input const& in, WHOIS::registry_builder& b)
  {
    b.suffix = in.string();
  }
};

template <>
struct action<server> {
  template <typename Input>
  static void apply(Input const& in, WHOIS::registry_builder& b)
  {
    b.add(in.string(), in.position().line);
  }
};

template <>
struct action<no_server> {
  template <typename Input>
  static void apply(Input const& in, WHOIS::registry_builder& b)
  {
    b.add(std::nullopt, in.position().line);
  }
};

} // namespace registry_file

namespace WHOIS {

std::string normalize_suffix(std::string_view suffix)
{
  return boost::algorithm::to_lower_copy(std::string(suffix));
}

Registry::Registry(
    std::initializer_list<std::pair<std::string_view, server_t>> init)
{
  for (auto const& [suffix, server] : init) {
    insert_(suffix, server);
  }
}

void Registry::insert_(std::string_view suffix, server_t server)
{
  if (suffix.size() < 2 || suffix.front() != '.') {
    throw std::invalid_argument(
        fmt::format("suffix «{}» must be a dot followed by a label", suffix));
  }
  if (server && server->empty()) {
    throw std::invalid_argument(
        fmt::format("empty server name for suffix «{}»", suffix));
  }
  auto const [it, inserted]
      = db_.emplace(normalize_suffix(suffix), std::move(server));
  if (!inserted) {
    throw std::invalid_argument(
        fmt::format("duplicate entry for suffix «{}»", it->first));
  }
}

Registry::server_t const* Registry::find(std::string_view suffix) const
{
  auto const it = db_.find(normalize_suffix(suffix));
  if (it == db_.end())
    return nullptr;
  return &it->second;
}

Registry Registry::merged(Registry const& overrides) const
{
  auto reg{*this};
  for (auto const& [suffix, server] : overrides) {
    reg.db_[suffix] = server;
  }
  return reg;
}

Registry Registry::parse(std::string_view text, char const* source)
{
  Registry reg;
  registry_builder b{reg, source, {}};

  memory_input<> in(text.data(), text.size(), source);
  try {
    if (!tao::pegtl::parse<registry_file::file, registry_file::action>(in,
                                                                       b)) {
      throw std::invalid_argument(
          fmt::format("{}: not a registry file", source));
    }
  }
  catch (parse_error const& e) {
    throw std::invalid_argument(e.what());
  }

  LOG(INFO) << source << ": " << reg.size() << " registry entries";
  return reg;
}

Registry Registry::load(fs::path const& path)
{
  if (!fs::exists(path)) {
    throw std::runtime_error(
        fmt::format("can't find registry file {}", path.string()));
  }

  // mapped_file_source refuses to map an empty file.
  if (fs::file_size(path) == 0) {
    LOG(WARNING) << "registry file " << path << " is empty";
    return Registry{};
  }

  boost::iostreams::mapped_file_source file;
  file.open(path.string());
  return parse(std::string_view(file.data(), file.size()),
               path.string().c_str());
}

} // namespace WHOIS
