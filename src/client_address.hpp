// client_address.hpp

#pragma once
#include <string>
#include <string_view>

// Which X-Forwarded-For hop identifies the client.
enum class ForwardedPolicy { Last, First, None };

ForwardedPolicy parse_forwarded_policy(std::string_view value);

// Client host: the chosen X-Forwarded-For hop when present, else the socket
// address, with any "::ffff:" IPv4-mapped prefix removed.
std::string client_host(std::string_view forwarded_for,
                        const std::string& remote_address,
                        ForwardedPolicy policy);

// "host:port" as recorded in PeerRecord::source_address.
std::string source_address(std::string_view forwarded_for,
                           const std::string& remote_address,
                           unsigned short remote_port, ForwardedPolicy policy);
