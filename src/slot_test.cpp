// slot_test.cpp
// Paranoid API/contract test for scell::optional_slot.
//
// Goals:
//  - Constant initialization with non-literal and over-aligned T.
//  - Exact constructor/destructor accounting across emplace / reset.
//  - Strong "left absent" state after a throwing constructor.

#include <QtTest/QtTest>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#if !defined(SCELL_ASSERT) && !defined(NDEBUG)
#  define SCELL_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "slot_test.h"
#include "scell/base/scell_slot.hpp"

namespace {

struct alignas(64) Wide {
    std::uint8_t bytes[64]{};
};

struct Counted {
    static inline std::atomic<int> live{0};
    static inline std::atomic<int> dtor{0};

    std::string name;

    explicit Counted(std::string n) : name(std::move(n)) { live++; }
    ~Counted() { live--; dtor++; }

    Counted(const Counted&) = delete;
    Counted& operator=(const Counted&) = delete;
};

struct Throwing {
    explicit Throwing(bool fail) {
        if (fail) {
            throw std::runtime_error("Throwing: requested");
        }
    }
};

constinit scell::optional_slot<Counted> g_counted;
constinit scell::optional_slot<Wide> g_wide;

template <class T>
static void api_smoke_compile() {
    using S = scell::optional_slot<T>;

    static_assert(std::is_trivially_destructible_v<S>);
    static_assert(std::is_nothrow_default_constructible_v<S>);
    static_assert(!std::is_copy_constructible_v<S>);
    static_assert(!std::is_move_assignable_v<S>);
    static_assert(alignof(S) >= alignof(T));
    static_assert(sizeof(S) >= sizeof(T));

    static_assert(std::is_same_v<decltype(std::declval<S&>().try_get()), T*>);
    static_assert(std::is_same_v<decltype(std::declval<const S&>().try_get()), const T*>);
    static_assert(std::is_same_v<decltype(std::declval<S&>().get()), T&>);
    static_assert(std::is_same_v<decltype(std::declval<const S&>().get()), const T&>);
}

class tst_optional_slot_api_paranoid : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        api_smoke_compile<int>();
        api_smoke_compile<Wide>();
        api_smoke_compile<Counted>();
        api_smoke_compile<Throwing>();

        static_assert(noexcept(std::declval<scell::optional_slot<int>&>().emplace(1)));
        static_assert(!noexcept(std::declval<scell::optional_slot<Throwing>&>().emplace(true)));
    }

    void starts_absent() {
        QVERIFY(!g_counted.has_value());
        QVERIFY(g_counted.try_get() == nullptr);

        const auto& cref = g_wide;
        QVERIFY(!cref.has_value());
        QVERIFY(cref.try_get() == nullptr);
    }

    void emplace_reset_accounting() {
        Counted::live = 0;
        Counted::dtor = 0;

        Counted& a = g_counted.emplace("first");
        QCOMPARE(a.name, std::string("first"));
        QVERIFY(g_counted.has_value());
        QCOMPARE(Counted::live.load(), 1);
        QVERIFY(g_counted.try_get() == &a);

        // emplace over a present value destroys the old one first
        Counted& b = g_counted.emplace("second");
        QCOMPARE(b.name, std::string("second"));
        QCOMPARE(Counted::live.load(), 1);
        QCOMPARE(Counted::dtor.load(), 1);

        g_counted.get().name += "!";
        const auto& cref = g_counted;
        QCOMPARE(cref.get().name, std::string("second!"));

        g_counted.reset();
        QVERIFY(!g_counted.has_value());
        QCOMPARE(Counted::live.load(), 0);
        QCOMPARE(Counted::dtor.load(), 2);

        // reset on an empty slot is a no-op
        g_counted.reset();
        QCOMPARE(Counted::dtor.load(), 2);
    }

    void over_aligned_storage() {
        Wide& w = g_wide.emplace();
        const auto addr = reinterpret_cast<std::uintptr_t>(&w);
        QCOMPARE(addr % alignof(Wide), std::uintptr_t{0});

        w.bytes[63] = 0x5Au;
        QCOMPARE(g_wide.get().bytes[63], std::uint8_t{0x5Au});
        QCOMPARE(g_wide.get().bytes[0], std::uint8_t{0u});
    }

    void throwing_constructor_leaves_absent() {
        scell::optional_slot<Throwing> slot;
        (void)slot.emplace(false);
        QVERIFY(slot.has_value());

        bool caught = false;
        try {
            (void)slot.emplace(true);
        } catch (const std::runtime_error&) {
            caught = true;
        }
        QVERIFY(caught);
        QVERIFY(!slot.has_value());
        QVERIFY(slot.try_get() == nullptr);

        (void)slot.emplace(false);
        QVERIFY(slot.has_value());
    }
};

} // namespace

int run_tst_optional_slot_api_paranoid(int argc, char** argv) {
    tst_optional_slot_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "slot_test.moc"
