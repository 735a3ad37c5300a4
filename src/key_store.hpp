#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

// The set of agents whose signatures we accept. Lookups always see a
// complete key set: replace() swaps in a new map, and readers keep the
// snapshot they started with.
class KeyStore
{
public:
    KeyStore();
    explicit KeyStore(const std::vector<TrustedAgentKey>& initial);

    std::optional<TrustedAgentKey> lookup(std::string_view agent_id) const;
    void replace(const std::vector<TrustedAgentKey>& keys);
    size_t size() const;

private:
    using KeyMap = std::unordered_map<std::string, TrustedAgentKey>;

    std::shared_ptr<const KeyMap> snapshot() const;
    static std::shared_ptr<const KeyMap>
    buildMap(const std::vector<TrustedAgentKey>& list);

    mutable std::mutex lock;
    std::shared_ptr<const KeyMap> keys;
};
