#include <gtest/gtest.h>
#include "../../src/batcher/batcher.h"
#include "../../src/object/graph_copier.h"
#include "../../src/object/graph_ops.h"
#include <atomic>
#include <thread>

using namespace DeepBatch;

class BatcherConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        copier_ = std::make_shared<GraphCopier>(heap_);
    }

    Heap heap_;
    std::shared_ptr<GraphCopier> copier_;
};

TEST_F(BatcherConcurrencyTest, ConcurrentDefersAreAllQueued) {
    const int num_threads = 8;
    const int defers_per_thread = 100;
    BatcherOptions options;
    options.max_items = num_threads * defers_per_thread + 1;
    Batcher batcher(copier_, options);

    std::vector<std::vector<HandlePtr>> handles(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < defers_per_thread; ++i) {
                ObjectRef source = heap_.NewList({heap_.NewInt(t), heap_.NewInt(i)});
                handles[t].push_back(batcher.Defer(source));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(batcher.PendingCount(), static_cast<size_t>(num_threads * defers_per_thread));

    batcher.Flush();
    EXPECT_EQ(batcher.PendingCount(), 0u);
    for (int t = 0; t < num_threads; ++t) {
        for (int i = 0; i < defers_per_thread; ++i) {
            ASSERT_TRUE(handles[t][i]->IsReady());
            ObjectRef copy = batcher.Get(handles[t][i]);
            EXPECT_EQ(copy->At(0)->AsInt(), t);
            EXPECT_EQ(copy->At(1)->AsInt(), i);
        }
    }

    BatcherStats stats = batcher.GetStats();
    EXPECT_EQ(stats.flushes, 1u);
    EXPECT_EQ(stats.items_resolved, static_cast<uint64_t>(num_threads * defers_per_thread));
}

TEST_F(BatcherConcurrencyTest, ConcurrentDeferAndGet) {
    const int num_threads = 6;
    const int iterations = 200;
    BatcherOptions options;
    options.max_items = 5;
    Batcher batcher(copier_, options);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < iterations; ++i) {
                ObjectRef source = heap_.NewList({heap_.NewInt(t * iterations + i)});
                HandlePtr handle = batcher.Defer(source, std::nullopt,
                                                 i % 2 ? AliasPolicy::kDuplicate : AliasPolicy::kPreserve);
                ObjectRef copy = batcher.Get(handle);
                if (copy == source || !DeepEquals(copy, source)) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(batcher.PendingCount(), 0u);
    EXPECT_EQ(batcher.GetStats().items_resolved, static_cast<uint64_t>(num_threads * iterations));
}

TEST_F(BatcherConcurrencyTest, ConcurrentProxyAccessFlushesOnce) {
    const int num_proxies = 16;
    Batcher batcher(copier_);

    std::vector<Proxy> proxies;
    for (int i = 0; i < num_proxies; ++i) {
        proxies.push_back(batcher.DeferProxy(heap_.NewList({heap_.NewInt(i)})));
    }

    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_proxies; ++i) {
        threads.emplace_back([&, i]() {
            if (proxies[i].At(0)->AsInt() != i) {
                wrong.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(wrong.load(), 0);
    EXPECT_EQ(batcher.GetStats().flushes, 1u);
}
