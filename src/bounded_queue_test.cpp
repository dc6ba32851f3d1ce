// bounded_queue_test.cpp
// Paranoid API/contract test for mpmc::bounded_queue.
//
// Goals:
//  - Capacity boundaries: Order 0 (one slot), full after capacity() sends,
//    empty on a fresh queue.
//  - Failure paths leave the caller's value untouched (move-only payloads).
//  - Object lifetime: received cells are reset to T{} at once, messages still
//    parked in the queue are destroyed with it.
//  - Threaded MPMC: every message delivered exactly once, nothing invented.
//
// Notes:
//  - No FIFO order is promised across producers, so threaded checks compare
//    multisets only.
//  - recv() returning false under contention is not proof of emptiness.
//    Consumers stop on a shared delivered counter, never on a false return.

#include <QtTest/QtTest>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if !defined(MPMC_ASSERT) && !defined(NDEBUG)
#  define MPMC_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "bounded_queue_test.h"
#include "bounded_queue.hpp"


namespace {

#if defined(NDEBUG)
constexpr int kHeavyItemsPerProducer = 200'000;
constexpr int kThreadTimeoutMs       = 8000;
#else
constexpr int kHeavyItemsPerProducer = 30'000;
constexpr int kThreadTimeoutMs       = 20'000;
#endif

// -------------------------
// Compile-time API smoke
// -------------------------

template <class Q>
static void api_smoke_compile() {
    using value_type = typename Q::value_type;

    static_assert(std::is_same_v<decltype(std::declval<Q&>().send(std::declval<value_type&&>())), bool>);
    static_assert(std::is_same_v<decltype(std::declval<Q&>().recv(std::declval<value_type&>())), bool>);
    static_assert(std::is_same_v<decltype(Q::capacity()), typename Q::size_type>);
    static_assert(noexcept(std::declval<Q&>().send(std::declval<value_type&&>())));
    static_assert(noexcept(std::declval<Q&>().recv(std::declval<value_type&>())));

    static_assert(!std::is_copy_constructible_v<Q>);
    static_assert(!std::is_move_constructible_v<Q>);
}

// -------------------------
// Test payloads
// -------------------------

struct Tracked {
    std::uint32_t seq{0};
    std::uint32_t cookie{0xC0FFEEu};

    static inline std::atomic<int> live{0};
    static inline std::atomic<long long> ctor{0};
    static inline std::atomic<long long> dtor{0};

    Tracked() noexcept { ++live; ++ctor; }
    explicit Tracked(std::uint32_t s) noexcept : seq(s) { ++live; ++ctor; }

    Tracked(const Tracked& o) noexcept : seq(o.seq), cookie(o.cookie) { ++live; ++ctor; }
    Tracked(Tracked&& o) noexcept : seq(o.seq), cookie(o.cookie) {
        o.cookie = 0xDEADu;
        ++live; ++ctor;
    }

    Tracked& operator=(const Tracked&) noexcept = default;
    Tracked& operator=(Tracked&& o) noexcept {
        seq = o.seq;
        cookie = o.cookie;
        o.cookie = 0xDEADu;
        return *this;
    }

    ~Tracked() {
        cookie = 0xBADC0DEu;
        ++dtor;
        --live;
    }
};

static void tracked_reset() {
    Tracked::live.store(0);
    Tracked::ctor.store(0);
    Tracked::dtor.store(0);
}

// Holds a shared resource so tests can observe when a cell lets go of it.
struct Resource {
    std::shared_ptr<int> res;
};

template <class Q>
static std::unique_ptr<Q> make_queue() {
    return std::make_unique<Q>();
}

// -------------------------
// Suites
// -------------------------

static void run_threaded_exactly_once(const char* name, int producers, int consumers, int per_producer) {
    using Q = mpmc::bounded_queue<std::uint64_t, 6u>;
    auto q = make_queue<Q>();

    const std::uint64_t total = static_cast<std::uint64_t>(producers) * static_cast<std::uint64_t>(per_producer);

    std::atomic<bool> abort{false};
    std::atomic<bool> go{false};
    std::atomic<std::uint64_t> delivered{0};

    auto should_abort = [&]() -> bool {
        return abort.load(std::memory_order_relaxed);
    };

    std::vector<std::vector<std::uint64_t>> got(static_cast<std::size_t>(consumers));
    std::vector<std::thread> threads;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(kThreadTimeoutMs);

    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p]() {
            while (!go.load(std::memory_order_acquire)) {
                MPMC_CPU_RELAX();
            }
            for (int i = 0; i < per_producer && !should_abort(); ++i) {
                std::uint64_t msg = (static_cast<std::uint64_t>(p) << 32) | static_cast<std::uint32_t>(i);
                while (!q->send(std::move(msg))) {
                    if (should_abort()) {
                        return;
                    }
                    if (std::chrono::steady_clock::now() > deadline) {
                        abort.store(true, std::memory_order_relaxed);
                        return;
                    }
                    std::this_thread::yield();
                }
            }
        });
    }

    for (int c = 0; c < consumers; ++c) {
        threads.emplace_back([&, c]() {
            auto& mine = got[static_cast<std::size_t>(c)];
            mine.reserve(static_cast<std::size_t>(total));
            while (!go.load(std::memory_order_acquire)) {
                MPMC_CPU_RELAX();
            }
            while (delivered.load(std::memory_order_acquire) < total && !should_abort()) {
                std::uint64_t msg = 0;
                if (q->recv(msg)) {
                    mine.push_back(msg);
                    delivered.fetch_add(1u, std::memory_order_acq_rel);
                    continue;
                }
                if (std::chrono::steady_clock::now() > deadline) {
                    abort.store(true, std::memory_order_relaxed);
                    return;
                }
                std::this_thread::yield();
            }
        });
    }

    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }

    QVERIFY2(!abort.load(std::memory_order_relaxed), name);
    QCOMPARE(delivered.load(), total);

    std::vector<std::uint64_t> all;
    all.reserve(static_cast<std::size_t>(total));
    for (const auto& v : got) {
        all.insert(all.end(), v.begin(), v.end());
    }
    QCOMPARE(static_cast<std::uint64_t>(all.size()), total);

    std::sort(all.begin(), all.end());
    std::size_t k = 0;
    for (int p = 0; p < producers; ++p) {
        for (int i = 0; i < per_producer; ++i, ++k) {
            const std::uint64_t expect = (static_cast<std::uint64_t>(p) << 32) | static_cast<std::uint32_t>(i);
            if (all[k] != expect) {
                QVERIFY2(false, name); // lost, duplicated or invented
            }
        }
    }

    // Nothing left behind.
    std::uint64_t extra = 0;
    QVERIFY2(!q->recv(extra), name);
}

class tst_bounded_queue_paranoid : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        api_smoke_compile<mpmc::bounded_queue<std::uint32_t, 0u>>();
        api_smoke_compile<mpmc::bounded_queue<std::unique_ptr<int>, 4u>>();
        api_smoke_compile<mpmc::bounded_queue<Tracked, 6u>>();

        static_assert(mpmc::bounded_queue<int, 0u>::capacity() == 1u);
        static_assert(mpmc::bounded_queue<int, 6u>::capacity() == 64u);
    }

    void order0_single_slot() {
        using Q = mpmc::bounded_queue<std::uint32_t, 0u>;
        auto q = make_queue<Q>();

        QVERIFY(q->send(7u));
        QVERIFY(!q->send(8u));

        std::uint32_t out = 0;
        QVERIFY(q->recv(out));
        QCOMPARE(out, 7u);
        QVERIFY(!q->recv(out));
        QCOMPARE(out, 7u);

        for (std::uint32_t i = 0; i < 1000u; ++i) {
            QVERIFY(q->send(i));
            QVERIFY(!q->send(i + 1u));
            QVERIFY(q->recv(out));
            QCOMPARE(out, i);
        }
    }

    void empty_boundary() {
        using Q = mpmc::bounded_queue<std::uint32_t, 4u>;
        auto q = make_queue<Q>();

        std::uint32_t out = 0xA5A5u;
        QVERIFY(!q->recv(out));
        QCOMPARE(out, 0xA5A5u);

        QCOMPARE(q->free_ring().tail(), Q::capacity());
        QCOMPARE(q->ready_ring().threshold(), Q::ring_type::kThresholdEmpty);
    }

    void full_after_capacity() {
        using Q = mpmc::bounded_queue<std::uint32_t, 4u>;
        auto q = make_queue<Q>();

        for (std::uint32_t i = 0; i < Q::capacity(); ++i) {
            QVERIFY(q->send(100u + i));
        }
        QVERIFY(!q->send(999u));
        QVERIFY(!q->send(999u));

        std::vector<std::uint32_t> got;
        std::uint32_t out = 0;
        while (q->recv(out)) {
            got.push_back(out);
        }
        QCOMPARE(static_cast<reg>(got.size()), Q::capacity());

        std::sort(got.begin(), got.end());
        for (std::uint32_t i = 0; i < Q::capacity(); ++i) {
            QCOMPARE(got[i], 100u + i);
        }

        // Slots are reusable after a full drain.
        for (int round = 0; round < 32; ++round) {
            for (std::uint32_t i = 0; i < Q::capacity(); ++i) {
                QVERIFY(q->send(i));
            }
            QVERIFY(!q->send(0u));
            for (std::uint32_t i = 0; i < Q::capacity(); ++i) {
                QVERIFY(q->recv(out));
            }
            QVERIFY(!q->recv(out));
        }
    }

    void small_set_roundtrip() {
        using Q = mpmc::bounded_queue<int, 2u>;
        auto q = make_queue<Q>();

        std::atomic<bool> abort{false};
        std::vector<int> got;
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(kThreadTimeoutMs);

        std::thread producer([&]() {
            for (int v = 1; v <= 3; ++v) {
                if (!q->send(int{v})) {
                    abort.store(true, std::memory_order_relaxed);
                    return;
                }
            }
        });

        std::thread consumer([&]() {
            int out = 0;
            while (got.size() < 3u) {
                if (q->recv(out)) {
                    got.push_back(out);
                    continue;
                }
                if (abort.load(std::memory_order_relaxed) ||
                    std::chrono::steady_clock::now() > deadline) {
                    abort.store(true, std::memory_order_relaxed);
                    return;
                }
                std::this_thread::yield();
            }
        });

        producer.join();
        consumer.join();

        QVERIFY(!abort.load(std::memory_order_relaxed));
        int out = 0;
        QVERIFY(!q->recv(out));

        std::sort(got.begin(), got.end());
        QVERIFY(got == (std::vector<int>{1, 2, 3}));
    }

    void copy_send_keeps_source() {
        using Q = mpmc::bounded_queue<std::string, 3u>;
        auto q = make_queue<Q>();

        const std::string hello = "hello, ring";
        QVERIFY(q->send(hello));
        QVERIFY(hello == "hello, ring");

        std::string out;
        QVERIFY(q->recv(out));
        QVERIFY(out == hello);
    }

    void move_only_payload() {
        using Q = mpmc::bounded_queue<std::unique_ptr<int>, 2u>;
        auto q = make_queue<Q>();

        for (int i = 0; i < 4; ++i) {
            QVERIFY(q->send(std::make_unique<int>(10 + i)));
        }

        // Full: the caller keeps ownership.
        auto keep = std::make_unique<int>(42);
        QVERIFY(!q->send(std::move(keep)));
        QVERIFY(keep != nullptr);
        QCOMPARE(*keep, 42);

        std::unique_ptr<int> out;
        std::vector<int> got;
        while (q->recv(out)) {
            QVERIFY(out != nullptr);
            got.push_back(*out);
        }
        std::sort(got.begin(), got.end());
        QVERIFY(got == (std::vector<int>{10, 11, 12, 13}));

        // Empty: out is left as it was.
        QVERIFY(out != nullptr);
        QCOMPARE(*out, got.back());
    }

    void received_cell_released() {
        using Q = mpmc::bounded_queue<Resource, 3u>;
        auto q = make_queue<Q>();

        auto token = std::make_shared<int>(7);
        QVERIFY(q->send(Resource{token}));
        QCOMPARE(token.use_count(), 2L);

        Resource out;
        QVERIFY(q->recv(out));
        QCOMPARE(token.use_count(), 2L); // only 'out' holds it now
        out.res.reset();
        QCOMPARE(token.use_count(), 1L);
    }

    void parked_messages_destroyed_with_queue() {
        using Q = mpmc::bounded_queue<Resource, 3u>;
        auto token = std::make_shared<int>(9);
        {
            auto q = make_queue<Q>();
            for (int i = 0; i < 5; ++i) {
                QVERIFY(q->send(Resource{token}));
            }
            QCOMPARE(token.use_count(), 6L);
        }
        QCOMPARE(token.use_count(), 1L);
    }

    void lifecycle_traced() {
        tracked_reset();
        {
            using Q = mpmc::bounded_queue<Tracked, 4u>;
            auto q = make_queue<Q>();
            QCOMPARE(Tracked::live.load(), static_cast<int>(Q::capacity()));

            Tracked out;
            for (std::uint32_t i = 0; i < 200u; ++i) {
                QVERIFY(q->send(Tracked{i}));
                if ((i % 3u) == 0u) {
                    QVERIFY(q->recv(out));
                    QVERIFY(out.cookie == 0xC0FFEEu);
                }
                if ((i % 16u) == 15u) {
                    while (q->recv(out)) {
                    }
                }
            }
            // Cells are values, so the live count never depends on fill level.
            QCOMPARE(Tracked::live.load(), static_cast<int>(Q::capacity()) + 1);
        }
        QCOMPARE(Tracked::live.load(), 0);
        QCOMPARE(Tracked::ctor.load(), Tracked::dtor.load());
    }

    void threaded_exactly_once_4x4() {
        run_threaded_exactly_once("threaded_exactly_once_4x4", 4, 4, 1000);
    }

    void threaded_exactly_once_heavy() {
        run_threaded_exactly_once("threaded_exactly_once_heavy", 4, 4, kHeavyItemsPerProducer);
    }

    void threaded_exactly_once_skewed() {
        run_threaded_exactly_once("threaded_exactly_once_1x4", 1, 4, kHeavyItemsPerProducer);
        run_threaded_exactly_once("threaded_exactly_once_4x1", 4, 1, kHeavyItemsPerProducer);
    }
};

} // namespace


int run_tst_bounded_queue_paranoid(int argc, char** argv) {
    tst_bounded_queue_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "bounded_queue_test.moc"
