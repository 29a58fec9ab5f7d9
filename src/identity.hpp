// identity.hpp

#pragma once
#include <optional>
#include <string>
#include <string_view>

// First 32 hex characters of SHA-256("name:endpoint:source_address"). A peer
// re-registering from the same address with the same name and endpoint gets
// the same id back.
std::string derive_peer_id(std::string_view name, std::string_view endpoint,
                           std::string_view source_address);

// A non-empty requested id wins, otherwise the id is derived.
std::string resolve_peer_id(const std::optional<std::string>& requested,
                            std::string_view name, std::string_view endpoint,
                            std::string_view source_address);
