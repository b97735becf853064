// isr_demo.cpp
// Host simulation of the "main loop + interrupt handler" pattern:
//   - g_led and g_ticks start empty (constinit, no constructor runs at startup).
//   - main initializes them in a critical section, then "enables interrupts"
//     by starting the timer thread.
//   - the timer ISR toggles the LED and counts ticks through borrow_mut().
//   - main polls through borrow() and falls back to a default while empty.

#include <QCoreApplication>
#include <QDebug>
#include <QLoggingCategory>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

#include "scell/static_cell.hpp"

Q_LOGGING_CATEGORY(lcIsrDemo, "scell.isr_demo")

using scell::cs::token;

namespace {

constexpr std::uint32_t kLedPin   = 5u;
constexpr std::uint32_t kTicks    = 50u;
constexpr auto          kTickTime = std::chrono::milliseconds(2);

// Stand-in for a GPIO output data register.
volatile std::uint32_t g_gpio_odr = 0u;

class Led {
public:
    Led(volatile std::uint32_t* odr, const std::uint32_t pin) noexcept
        : odr_(odr), mask_(1u << pin) {}

    Led(const Led&) = delete;
    Led& operator=(const Led&) = delete;

    void toggle() noexcept { *odr_ = *odr_ ^ mask_; }
    bool is_on() const noexcept { return (*odr_ & mask_) != 0u; }

private:
    volatile std::uint32_t* odr_;
    std::uint32_t mask_;
};

constinit scell::static_cell<Led> g_led;
constinit scell::static_cell<std::uint32_t> g_ticks;

std::atomic<bool> g_irq_enabled{false};

// TIMx_IRQHandler
void timer_isr() {
    scell::cs::with([](const token& cs) {
        g_led.borrow_mut(cs, [](Led& led) { led.toggle(); }, [] {});
        g_ticks.borrow_mut(cs, [](std::uint32_t& t) { ++t; }, [] {});
    });
}

std::uint32_t read_ticks() {
    return scell::cs::with([](const token& cs) {
        return g_ticks.borrow(cs, [](const std::uint32_t& t) { return t; }, [] { return std::uint32_t{0}; });
    });
}

} // namespace

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    // Before init: every access runs the fallback.
    const bool led_before = scell::cs::with([](const token& cs) {
        return g_led.borrow(cs, [](const Led& led) { return led.is_on(); }, [] { return false; });
    });
    qCInfo(lcIsrDemo) << "before init: led present =" << led_before << "ticks =" << read_ticks();

    scell::cs::with([](const token& cs) {
        g_led.emplace(cs, &g_gpio_odr, kLedPin);
        g_ticks.init(cs, 0u);
    });
    qCInfo(lcIsrDemo) << "cells initialized, enabling timer interrupt";

    // Interrupts are enabled only after the cells hold a value.
    g_irq_enabled.store(true, std::memory_order_release);
    std::thread timer([] {
        for (std::uint32_t i = 0; i < kTicks && g_irq_enabled.load(std::memory_order_acquire); ++i) {
            std::this_thread::sleep_for(kTickTime);
            timer_isr();
        }
    });

    std::uint32_t last = 0u;
    while (last < kTicks) {
        const std::uint32_t now = read_ticks();
        if (now / 10u != last / 10u) {
            const bool on = scell::cs::with([](const token& cs) {
                return g_led.borrow(cs, [](const Led& led) { return led.is_on(); }, [] { return false; });
            });
            qCDebug(lcIsrDemo) << "tick" << now << "led" << (on ? "on" : "off");
        }
        last = now;
        std::this_thread::yield();
    }

    g_irq_enabled.store(false, std::memory_order_release);
    timer.join();

    const std::uint32_t total = read_ticks();
    const bool led_on = scell::cs::with([](const token& cs) {
        return g_led.borrow(cs, [](const Led& led) { return led.is_on(); }, [] { return false; });
    });

    if (total != kTicks || led_on != ((kTicks % 2u) != 0u)) {
        qCWarning(lcIsrDemo) << "unexpected state: ticks =" << total << "led =" << led_on;
        return 1;
    }

    qCInfo(lcIsrDemo) << "done: ticks =" << total << "led =" << (led_on ? "on" : "off");
    return 0;
}
