#ifndef TLD_DOT_HPP
#define TLD_DOT_HPP

#include <optional>
#include <string>

#include <glog/logging.h>

extern "C" {
#include <libpsl.h>
}

// The Public Suffix List: "www.example.co.uk" is registered as
// "example.co.uk".

class TLD {
public:
  TLD(TLD const&) = delete;
  TLD& operator=(TLD const&) = delete;

  TLD()
    : ctx_(CHECK_NOTNULL(psl_latest(nullptr)))
  {
  }
  ~TLD() { psl_free(ctx_); }

  std::optional<std::string> registered_domain(std::string const& dom) const
  {
    auto const reg = psl_registrable_domain(ctx_, dom.c_str());
    if (reg == nullptr)
      return {};
    return std::string{reg};
  }

  bool is_public_suffix(std::string const& dom) const
  {
    return psl_is_public_suffix(ctx_, dom.c_str()) != 0;
  }

private:
  psl_ctx_t* ctx_;
};

#endif // TLD_DOT_HPP
