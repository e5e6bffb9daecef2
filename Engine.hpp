#ifndef ENGINE_DOT_HPP
#define ENGINE_DOT_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "DNS-message.hpp"
#include "RecordStore.hpp"
#include "Router.hpp"

namespace Engine {

struct answered {
  DNS::RR_collection answers;
  uint32_t           ttl;
};

struct failed {
  DNS::Rcode rcode;
};

struct forwarded {
};

using outcome = std::variant<answered, failed, forwarded>;

char const* outcome_c_str(outcome const& o);

// Resolution of the queries the local zone is responsible for.
// Everything else is handed back as forwarded.

class resolver {
public:
  resolver(std::string suffix, uint32_t ttl, RecordStore& store);

  outcome resolve(DNS::Query const& q) const;

  Router::table const& router() const { return router_; }

private:
  outcome localhost_(DNS::RR_type type) const;
  outcome local_(Router::rule which, std::string const& label) const;
  outcome ptr_(Router::rule which, std::string const& name) const;

  Router::table router_;
  uint32_t      ttl_;
  RecordStore&  store_;
};

} // namespace Engine

#endif // ENGINE_DOT_HPP
