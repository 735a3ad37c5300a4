#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "key_store.hpp"

namespace {

TrustedAgentKey agent(const std::string& id, const std::string& name)
{
    TrustedAgentKey key;
    key.agent_id = id;
    key.display_name = name;
    key.public_key = "key-of-" + id;
    return key;
}

} // namespace

TEST(KeyStoreTest, Lookup)
{
    KeyStore store({agent("https://a.example", "A"),
                    agent("https://b.example", "B")});
    EXPECT_EQ(store.size(), 2);
    auto a = store.lookup("https://a.example");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->display_name, "A");
    EXPECT_FALSE(store.lookup("https://c.example").has_value());
}

TEST(KeyStoreTest, DuplicateKeepsFirst)
{
    KeyStore store({agent("https://a.example", "First"),
                    agent("https://a.example", "Second")});
    EXPECT_EQ(store.size(), 1);
    EXPECT_EQ(store.lookup("https://a.example")->display_name, "First");
}

TEST(KeyStoreTest, Replace)
{
    KeyStore store;
    EXPECT_EQ(store.size(), 0);
    store.replace({agent("https://a.example", "A")});
    EXPECT_TRUE(store.lookup("https://a.example").has_value());
    store.replace({agent("https://b.example", "B")});
    EXPECT_FALSE(store.lookup("https://a.example").has_value());
    EXPECT_TRUE(store.lookup("https://b.example").has_value());
}

TEST(KeyStoreTest, SwapDuringLookups)
{
    const std::vector<TrustedAgentKey> set_one = {
        agent("https://a.example", "one"), agent("https://b.example", "one")};
    const std::vector<TrustedAgentKey> set_two = {
        agent("https://a.example", "two"), agent("https://b.example", "two")};
    KeyStore store(set_one);

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for(int i = 0; i < 4; i++)
    {
        readers.emplace_back([&]
        {
            while(!done)
            {
                auto a = store.lookup("https://a.example");
                auto b = store.lookup("https://b.example");
                if(!a.has_value() || !b.has_value())
                {
                    torn++;
                }
            }
        });
    }
    for(int i = 0; i < 200; i++)
    {
        store.replace(i % 2 == 0 ? set_two : set_one);
    }
    done = true;
    for(auto& t : readers)
    {
        t.join();
    }
    EXPECT_EQ(torn, 0);
}
