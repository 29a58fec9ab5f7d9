#include "client_address.hpp"

#include <stdexcept>

namespace {
std::string_view trim(std::string_view s) {
  auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos)
    return {};
  auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

std::string strip_mapped_prefix(std::string_view ip) {
  constexpr std::string_view kMapped = "::ffff:";
  if (ip.substr(0, kMapped.size()) == kMapped)
    ip.remove_prefix(kMapped.size());
  return std::string(ip);
}
} // namespace

ForwardedPolicy parse_forwarded_policy(std::string_view value) {
  if (value == "last")
    return ForwardedPolicy::Last;
  if (value == "first")
    return ForwardedPolicy::First;
  if (value == "none")
    return ForwardedPolicy::None;
  throw std::invalid_argument("unknown forwarded-for policy: " +
                              std::string(value));
}

std::string client_host(std::string_view forwarded_for,
                        const std::string& remote_address,
                        ForwardedPolicy policy) {
  std::string_view hop;
  if (policy == ForwardedPolicy::Last) {
    auto comma = forwarded_for.rfind(',');
    hop = trim(comma == std::string_view::npos
                   ? forwarded_for
                   : forwarded_for.substr(comma + 1));
  } else if (policy == ForwardedPolicy::First) {
    hop = trim(forwarded_for.substr(0, forwarded_for.find(',')));
  }
  return strip_mapped_prefix(hop.empty() ? std::string_view(remote_address)
                                         : hop);
}

std::string source_address(std::string_view forwarded_for,
                           const std::string& remote_address,
                           unsigned short remote_port,
                           ForwardedPolicy policy) {
  return client_host(forwarded_for, remote_address, policy) + ":" +
         std::to_string(remote_port);
}
