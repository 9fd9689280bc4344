#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

struct CatalogRow {
    int64_t id;
    std::string code;

    CatalogRow(int64_t i = 0, const std::string& c = "") : id(i), code(c) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<int64_t, CatalogRow> map;
};

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert(1, std::make_shared<CatalogRow>(1, "1105"));

    auto found = map.find(1);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->code, "1105");
    EXPECT_EQ(map.find(2), nullptr);
}

TEST_F(ThreadSafeMapTest, OverwriteKeepsOldSnapshotIntact) {
    map.insert(1, std::make_shared<CatalogRow>(1, "1105"));
    auto snapshot = map.find(1);

    map.insert(1, std::make_shared<CatalogRow>(1, "110505"));

    EXPECT_EQ(snapshot->code, "1105");
    EXPECT_EQ(map.find(1)->code, "110505");
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, RemoveAndClear) {
    map.insert(1, std::make_shared<CatalogRow>(1, "1105"));
    map.insert(2, std::make_shared<CatalogRow>(2, "2205"));

    EXPECT_TRUE(map.remove(1));
    EXPECT_FALSE(map.remove(1));
    EXPECT_FALSE(map.contains(1));
    EXPECT_TRUE(map.contains(2));

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, GetAllReturnsEveryValue) {
    for (int64_t id = 1; id <= 5; ++id) {
        map.insert(id, std::make_shared<CatalogRow>(id, "code-" + std::to_string(id)));
    }

    auto all = map.getAll();
    ASSERT_EQ(all.size(), 5u);

    std::vector<int64_t> ids;
    for (const auto& row : all) {
        ids.push_back(row->id);
    }
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2, 3, 4, 5}));
}

// Параллельные писатели в непересекающиеся диапазоны ключей
TEST_F(ThreadSafeMapTest, ConcurrentWritersAllValuesVisible) {
    const int NUM_WRITERS = 4;
    const int VALUES_PER_WRITER = 100;
    std::vector<std::thread> threads;

    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < VALUES_PER_WRITER; ++i) {
                int64_t id = writer * 1000 + i;
                map.insert(id, std::make_shared<CatalogRow>(id, std::to_string(id)));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.size(), static_cast<size_t>(NUM_WRITERS * VALUES_PER_WRITER));
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        for (int i = 0; i < VALUES_PER_WRITER; ++i) {
            auto found = map.find(writer * 1000 + i);
            ASSERT_NE(found, nullptr);
            EXPECT_EQ(found->code, std::to_string(writer * 1000 + i));
        }
    }
}

// Читатель всегда получает валидный объект, пока идёт перезапись
TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_NoDataCorruption) {
    map.insert(7, std::make_shared<CatalogRow>(7, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 3; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(7, std::make_shared<CatalogRow>(7, "w" + std::to_string(writer)));
            }
        });
    }

    for (int reader = 0; reader < 3; ++reader) {
        threads.emplace_back([this, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(7);
                ASSERT_NE(found, nullptr);
                EXPECT_EQ(found->id, 7);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 300);
}
