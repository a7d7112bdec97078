#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

struct Versioned {
    std::string owner;
    int64_t version;

    Versioned(const std::string& o = "", int64_t v = 0) : owner(o), version(v) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Versioned> map;

    static std::shared_ptr<Versioned> make(const std::string& owner, int64_t version = 0) {
        return std::make_shared<Versioned>(owner, version);
    }
};

// ============================================================================
// Базовые операции
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertFindContains) {
    map.insert("k", make("alice", 1));

    auto found = map.find("k");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->owner, "alice");
    EXPECT_TRUE(map.contains("k"));
    EXPECT_FALSE(map.contains("missing"));
    EXPECT_EQ(map.find("missing"), nullptr);
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_ReturnsExistingOnConflict) {
    auto first = make("first");
    auto second = make("second");

    EXPECT_EQ(map.insertIfAbsent("k", first), nullptr);

    auto existing = map.insertIfAbsent("k", second);
    ASSERT_NE(existing, nullptr);
    EXPECT_EQ(existing, first);
    EXPECT_EQ(map.find("k")->owner, "first");
}

TEST_F(ThreadSafeMapTest, ComputeIfPresent_MissingKeyIsNotCreated) {
    bool called = false;
    auto result = map.computeIfPresent("k", [&](const auto&) {
        called = true;
        return make("ghost");
    });

    EXPECT_EQ(result, nullptr);
    EXPECT_FALSE(called);
    EXPECT_FALSE(map.contains("k"));
}

TEST_F(ThreadSafeMapTest, ComputeIfPresent_NullResultErases) {
    map.insert("k", make("alice"));

    auto result = map.computeIfPresent("k", [](const auto&) {
        return std::shared_ptr<Versioned>();
    });

    EXPECT_EQ(result, nullptr);
    EXPECT_FALSE(map.contains("k"));
}

TEST_F(ThreadSafeMapTest, Compute_CreatesAndReplaces) {
    auto bump = [](const std::shared_ptr<Versioned>& current) {
        int64_t next = current ? current->version + 1 : 1;
        return std::make_shared<Versioned>("bob", next);
    };

    EXPECT_EQ(map.compute("k", bump)->version, 1);
    EXPECT_EQ(map.compute("k", bump)->version, 2);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, Remove_ReturnsRemovedValue) {
    map.insert("k", make("alice"));

    auto removed = map.remove("k");
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->owner, "alice");
    EXPECT_EQ(map.remove("k"), nullptr);
}

TEST_F(ThreadSafeMapTest, RemoveIf_RespectsPredicate) {
    map.insert("k", make("alice"));

    EXPECT_FALSE(map.removeIf("k", [](const Versioned& v) { return v.owner == "bob"; }));
    EXPECT_TRUE(map.contains("k"));

    EXPECT_TRUE(map.removeIf("k", [](const Versioned& v) { return v.owner == "alice"; }));
    EXPECT_FALSE(map.contains("k"));
}

TEST_F(ThreadSafeMapTest, GetAllAndClear) {
    map.insert("a", make("a"));
    map.insert("b", make("b"));

    auto all = map.getAll();
    ASSERT_EQ(all.size(), 2u);

    std::vector<std::string> owners;
    for (const auto& v : all) owners.push_back(v->owner);
    std::sort(owners.begin(), owners.end());
    EXPECT_EQ(owners, (std::vector<std::string>{"a", "b"}));

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

// ============================================================================
// Многопоточность
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertIfAbsent_ExactlyOneWinner) {
    const int NUM_THREADS = 16;
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, t, &winners]() {
            if (map.insertIfAbsent("key", make("t" + std::to_string(t))) == nullptr) {
                winners++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners, 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, ComputeIfPresent_NoLostUpdates) {
    const int NUM_THREADS = 8;
    const int INCREMENTS = 200;
    map.insert("counter", make("shared", 0));

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < INCREMENTS; ++i) {
                map.computeIfPresent("counter", [](const std::shared_ptr<Versioned>& current) {
                    return std::make_shared<Versioned>(current->owner, current->version + 1);
                });
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(map.find("counter")->version, NUM_THREADS * INCREMENTS);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadersAlwaysSeeValue) {
    map.insert("k", make("initial"));

    std::vector<std::thread> threads;
    std::atomic<int> reads(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert("k", make("w" + std::to_string(writer), i));
            }
        });
    }
    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &reads]() {
            for (int i = 0; i < 100; ++i) {
                if (map.find("k") != nullptr) {
                    reads++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(reads, 400);
}
