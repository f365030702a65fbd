#ifndef WHOIS_REGISTRY_DOT_HPP
#define WHOIS_REGISTRY_DOT_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "fs.hpp"

namespace WHOIS {

// Maps a TLD suffix (".com") to the host name of its WHOIS server.  A
// suffix may be present with no server at all, meaning the TLD is known
// but has no public WHOIS service; that is not the same as a suffix
// that is missing from the registry.

class Registry {
public:
  using server_t = std::optional<std::string>;
  using map_t    = std::map<std::string, server_t, std::less<>>;

  Registry() = default;
  Registry(std::initializer_list<std::pair<std::string_view, server_t>> init);

  // The compiled-in IANA root zone database.
  static Registry const& root_zone();

  static Registry load(fs::path const& path);
  static Registry parse(std::string_view text, char const* source);

  // A copy of this registry with every entry of overrides added,
  // replacing any entry already present for the same suffix.
  Registry merged(Registry const& overrides) const;

  // nullptr if the suffix is not in the registry, otherwise the entry.
  server_t const* find(std::string_view suffix) const;

  bool contains(std::string_view suffix) const
  {
    return find(suffix) != nullptr;
  }

  std::size_t size() const { return db_.size(); }
  bool        empty() const { return db_.empty(); }

  map_t::const_iterator begin() const { return db_.begin(); }
  map_t::const_iterator end() const { return db_.end(); }

private:
  friend struct registry_builder;

  void insert_(std::string_view suffix, server_t server);

  map_t db_;
};

// Lower-case a suffix the way registry keys are stored.
std::string normalize_suffix(std::string_view suffix);

} // namespace WHOIS

#endif // WHOIS_REGISTRY_DOT_HPP
