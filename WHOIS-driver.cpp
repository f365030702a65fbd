#include "WHOIS-driver.hpp"

#include "WHOIS.hpp"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include <fmt/color.h>
#include <fmt/format.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

namespace {
void print_in(std::ostream&      os,
              bool               color,
              fmt::color         fg,
              std::string const& line)
{
  if (color)
    os << fmt::format(fmt::fg(fg), "{}", line) << '\n';
  else
    os << line << '\n';
  os.flush();
}

fmt::color color_of(WHOIS::status st)
{
  switch (st) {
  case WHOIS::status::free: return fmt::color::green;
  case WHOIS::status::taken: return fmt::color::red;
  case WHOIS::status::unknown: return fmt::color::yellow;
  }
  return fmt::color::yellow;
}
} // namespace

namespace WHOIS {

bool valid_timeout(std::uint64_t seconds)
{
  auto const max = std::chrono::seconds(Config::max_timeout).count();
  return seconds <= static_cast<std::uint64_t>(max);
}

std::vector<std::string> parse_domains(std::string_view text)
{
  auto const str = std::string(text);

  std::vector<std::string> lines;
  boost::algorithm::split(lines, str, boost::algorithm::is_any_of("\n"));

  std::vector<std::string> domains;
  for (auto& line : lines) {
    boost::algorithm::trim(line);
    if (line.empty() || line.front() == '#')
      continue;
    domains.push_back(std::move(line));
  }
  return domains;
}

std::vector<std::string> read_domains(fs::path const& path)
{
  if (!fs::exists(path))
    throw std::runtime_error(
        fmt::format("can't find domain list {}", path.string()));

  // mapped_file_source refuses to map an empty file.
  if (fs::file_size(path) == 0)
    return {};

  boost::iostreams::mapped_file_source file;
  file.open(path.string());

  auto domains = parse_domains(std::string_view(file.data(), file.size()));
  LOG(INFO) << domains.size() << " domains from " << path;
  return domains;
}

std::string status_line(status st, std::string_view domain)
{
  switch (st) {
  case status::free: return fmt::format("[FREE ] {}", domain);
  case status::taken: return fmt::format("[TAKEN] {}", domain);
  case status::unknown: return fmt::format("[?????] {}", domain);
  }
  return fmt::format("[?????] {}", domain);
}

Driver::Driver(Registry registry, query_fn query, options opts)
  : registry_(std::move(registry))
  , res_(registry_)
  , query_(std::move(query))
  , opts_(std::move(opts))
{
  CHECK(query_) << "no query function";
  if (opts_.registered_domain)
    tld_.emplace();
}

std::string Driver::query_domain_(std::string const& domain) const
{
  if (tld_) {
    if (tld_->is_public_suffix(domain)) {
      LOG(WARNING) << domain << " is a public suffix";
      return domain;
    }
    auto const reg = tld_->registered_domain(domain);
    if (reg && *reg != domain) {
      LOG(INFO) << "registered domain of " << domain << " is " << *reg;
      return *reg;
    }
  }
  return domain;
}

std::string Driver::server_for_(std::string const& domain) const
{
  if (!opts_.server.empty())
    return opts_.server;
  return res_.resolve(domain);
}

void Driver::list(std::ostream& os) const
{
  for (auto const& [suffix, server] : registry_) {
    if (!server || suffix.rfind(".xn--", 0) == 0)
      continue;
    os << fmt::format("{:<24} {}\n", suffix, *server);
  }
}

void Driver::lookup(std::string const& domain, std::ostream& os) const
{
  auto const dom    = query_domain_(domain);
  auto const server = server_for_(dom);
  os << query_(server, dom) << '\n';
}

void Driver::simple(std::vector<std::string> const& domains,
                    std::ostream&                   os) const
{
  for (auto const& domain : domains) {
    auto const dom = query_domain_(domain);
    try {
      auto const server   = server_for_(dom);
      auto const response = query_(server, fmt::format("domain {}", dom));

      auto const st = Classifier::standard().classify(server, response, dom);
      print_in(os, opts_.color, color_of(st), status_line(st, domain));
    }
    catch (resolution_error const& ex) {
      if (!opts_.keep_going)
        throw;
      print_in(os, opts_.color, fmt::color::red,
               fmt::format("[ERROR] {}: {}", domain, ex.what()));
    }
    catch (query_error const& ex) {
      if (!opts_.keep_going)
        throw;
      print_in(os, opts_.color, fmt::color::red,
               fmt::format("[ERROR] {}: {}", domain, ex.what()));
    }
  }
}

} // namespace WHOIS
