// test_worker_pool_gtest.cpp
// Unit tests for the FIFO worker pool

#include <gtest/gtest.h>
#include "../xmlcompare/worker_pool.h"
#include <atomic>
#include <unistd.h>

static void simple_task(void* data) {
    std::atomic<int>* counter = (std::atomic<int>*)data;
    counter->fetch_add(1);
}

TEST(WorkerPool, CreateAndDestroy) {
    WorkerPool* pool = worker_pool_create(2);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->num_threads, 2);
    worker_pool_destroy(pool);
}

TEST(WorkerPool, DefaultThreadCount) {
    WorkerPool* pool = worker_pool_create(0);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->num_threads, 8);
    worker_pool_destroy(pool);
}

TEST(WorkerPool, ExecuteTask) {
    WorkerPool* pool = worker_pool_create(2);
    std::atomic<int> counter(0);
    EXPECT_TRUE(worker_pool_enqueue(pool, simple_task, &counter));
    worker_pool_wait_all(pool);
    EXPECT_EQ(counter.load(), 1);
    EXPECT_EQ(worker_pool_get_active_count(pool), 0);
    EXPECT_EQ(worker_pool_get_queued_count(pool), 0);
    worker_pool_destroy(pool);
}

struct OrderProbe {
    int* order;
    std::atomic<int>* next_slot;
    int id;
};

static void record_order(void* data) {
    OrderProbe* probe = (OrderProbe*)data;
    int pos = probe->next_slot->fetch_add(1);
    probe->order[pos] = probe->id;
    usleep(5000);
}

TEST(WorkerPool, FifoOrderOnSingleThread) {
    WorkerPool* pool = worker_pool_create(1);
    int order[4] = {0, 0, 0, 0};
    std::atomic<int> next_slot(0);
    OrderProbe probes[4];
    for (int i = 0; i < 4; i++) {
        probes[i].order = order;
        probes[i].next_slot = &next_slot;
        probes[i].id = i + 1;
        ASSERT_TRUE(worker_pool_enqueue(pool, record_order, &probes[i]));
    }
    worker_pool_wait_all(pool);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_EQ(order[2], 3);
    EXPECT_EQ(order[3], 4);
    worker_pool_destroy(pool);
}

struct ConcurrencyProbe {
    std::atomic<int> running;
    std::atomic<int> peak;
    ConcurrencyProbe() : running(0), peak(0) {}
};

static void track_concurrency(void* data) {
    ConcurrencyProbe* probe = (ConcurrencyProbe*)data;
    int now = probe->running.fetch_add(1) + 1;
    int seen = probe->peak.load();
    while (now > seen && !probe->peak.compare_exchange_weak(seen, now)) {}
    usleep(2000);
    probe->running.fetch_sub(1);
}

TEST(WorkerPool, NeverExceedsThreadCount) {
    WorkerPool* pool = worker_pool_create(3);
    ConcurrencyProbe probe;
    for (int i = 0; i < 30; i++) {
        ASSERT_TRUE(worker_pool_enqueue(pool, track_concurrency, &probe));
    }
    worker_pool_wait_all(pool);
    EXPECT_LE(probe.peak.load(), 3);
    EXPECT_GE(probe.peak.load(), 1);
    worker_pool_destroy(pool);
}

TEST(WorkerPool, ManyTasks) {
    WorkerPool* pool = worker_pool_create(4);
    std::atomic<int> counter(0);
    for (int i = 0; i < 200; i++) {
        worker_pool_enqueue(pool, simple_task, &counter);
    }
    worker_pool_wait_all(pool);
    EXPECT_EQ(counter.load(), 200);
    worker_pool_destroy(pool);
}

TEST(WorkerPool, ShutdownDrainsQueueAndRejectsNewTasks) {
    WorkerPool* pool = worker_pool_create(1);
    std::atomic<int> counter(0);
    for (int i = 0; i < 10; i++) {
        ASSERT_TRUE(worker_pool_enqueue(pool, simple_task, &counter));
    }
    worker_pool_shutdown(pool);
    EXPECT_FALSE(worker_pool_enqueue(pool, simple_task, &counter));
    worker_pool_destroy(pool);
    EXPECT_EQ(counter.load(), 10);
}

TEST(WorkerPool, NullArguments) {
    EXPECT_FALSE(worker_pool_enqueue(nullptr, simple_task, nullptr));
    WorkerPool* pool = worker_pool_create(1);
    EXPECT_FALSE(worker_pool_enqueue(pool, nullptr, nullptr));
    worker_pool_wait_all(nullptr);
    worker_pool_destroy(pool);
}
