// tests/di/test_concurrency.cpp
#define BOOST_TEST_MODULE concurrency_tests
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "ivy/di/container.hpp"
#include "ivy/di/exceptions.hpp"
#include "ivy/di/lifetime_scope.hpp"

using namespace ivy::di;

struct ICache {
    virtual ~ICache() = default;
};

class SlowCache : public ICache {
public:
    static std::atomic<int> constructed;

    SlowCache() {
        ++constructed;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    static void reflect(TypeBuilder<SlowCache>& type) {
        type.implements<ICache>();
    }
};

std::atomic<int> SlowCache::constructed{0};

class CacheClient {
public:
    explicit CacheClient(std::shared_ptr<ICache> cache) : cache_(std::move(cache)) {}

    static void reflect(TypeBuilder<CacheClient>& type) {
        type.constructor<std::shared_ptr<ICache>>({"cache"});
    }

    std::shared_ptr<ICache> cache_;
};

constexpr int kThreads = 8;

template <typename Work>
void run_concurrently(Work work) {
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back(work, i);
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

// =====================================
// Concurrent resolution
// =====================================

BOOST_AUTO_TEST_SUITE(concurrency_suite)

BOOST_AUTO_TEST_CASE(test_singleton_constructed_once) {
    Container container;
    container.register_type<ICache, SlowCache>(ServiceLifetime::SINGLETON);
    SlowCache::constructed = 0;

    std::mutex results_mutex;
    std::set<ICache*> results;
    run_concurrently([&](int) {
        auto cache = container.resolve<ICache>();
        std::lock_guard<std::mutex> lock(results_mutex);
        results.insert(cache.get());
    });

    BOOST_CHECK_EQUAL(SlowCache::constructed.load(), 1);
    BOOST_CHECK_EQUAL(results.size(), 1);
}

BOOST_AUTO_TEST_CASE(test_scoped_constructed_once_per_scope) {
    Container container;
    container.register_type<ICache, SlowCache>(ServiceLifetime::SCOPED);
    SlowCache::constructed = 0;
    auto scope = container.begin_scope();

    std::mutex results_mutex;
    std::set<ICache*> results;
    run_concurrently([&](int) {
        auto client = scope->resolve<CacheClient>();
        std::lock_guard<std::mutex> lock(results_mutex);
        results.insert(client->cache_.get());
    });

    BOOST_CHECK_EQUAL(SlowCache::constructed.load(), 1);
    BOOST_CHECK_EQUAL(results.size(), 1);
    BOOST_CHECK_EQUAL(scope->instance_count(), 1);
}

BOOST_AUTO_TEST_CASE(test_transients_are_distinct) {
    Container container;
    container.register_type<ICache, SlowCache>();

    std::mutex results_mutex;
    std::vector<std::shared_ptr<ICache>> results;
    run_concurrently([&](int) {
        auto cache = container.resolve<ICache>();
        std::lock_guard<std::mutex> lock(results_mutex);
        results.push_back(cache);
    });

    std::set<ICache*> distinct;
    for (const auto& cache : results) {
        distinct.insert(cache.get());
    }
    BOOST_CHECK_EQUAL(distinct.size(), kThreads);
}

BOOST_AUTO_TEST_CASE(test_registration_during_resolution) {
    Container container;
    container.register_type<ICache, SlowCache>(ServiceLifetime::SINGLETON);
    std::atomic<int> failures{0};

    run_concurrently([&](int index) {
        try {
            container.register_type<ICache, SlowCache>(
                ServiceLifetime::TRANSIENT, index);
            container.resolve<ICache>(index);
            container.resolve<CacheClient>();
        } catch (const DiError&) {
            ++failures;
        }
    });

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK_EQUAL(container.registration_count(), kThreads + 1);
    BOOST_CHECK_EQUAL(container.resolve_all<ICache>().size(), kThreads + 1);
}

BOOST_AUTO_TEST_CASE(test_cycle_detection_is_per_thread) {
    Container container;
    container.register_type<ICache, SlowCache>(ServiceLifetime::TRANSIENT);
    std::atomic<int> failures{0};

    // Several threads resolving the same registration at once is not a cycle
    run_concurrently([&](int) {
        try {
            container.resolve<CacheClient>();
        } catch (const CircularDependencyError&) {
            ++failures;
        }
    });

    BOOST_CHECK_EQUAL(failures.load(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
