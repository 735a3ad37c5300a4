#include "key_store.hpp"

#include <spdlog/spdlog.h>

KeyStore::KeyStore() : keys(std::make_shared<const KeyMap>()) {}

KeyStore::KeyStore(const std::vector<TrustedAgentKey>& initial)
    : keys(buildMap(initial))
{
}

std::shared_ptr<const KeyStore::KeyMap>
KeyStore::buildMap(const std::vector<TrustedAgentKey>& list)
{
    auto map = std::make_shared<KeyMap>();
    for(const TrustedAgentKey& key : list)
    {
        if(!map->emplace(key.agent_id, key).second)
        {
            spdlog::warn("Duplicate trusted agent {}, keeping the first entry",
                         key.agent_id);
        }
    }
    return map;
}

std::shared_ptr<const KeyStore::KeyMap> KeyStore::snapshot() const
{
    std::lock_guard<std::mutex> guard(lock);
    return keys;
}

std::optional<TrustedAgentKey> KeyStore::lookup(std::string_view agent_id) const
{
    auto current = snapshot();
    auto it = current->find(std::string(agent_id));
    if(it == current->end())
    {
        return std::nullopt;
    }
    return it->second;
}

void KeyStore::replace(const std::vector<TrustedAgentKey>& new_keys)
{
    auto map = buildMap(new_keys);
    {
        std::lock_guard<std::mutex> guard(lock);
        keys = std::move(map);
    }
    spdlog::info("Loaded {} trusted agent keys", new_keys.size());
}

size_t KeyStore::size() const
{
    return snapshot()->size();
}
