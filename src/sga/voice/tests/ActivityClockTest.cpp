#include "sga/voice/ActivityClock.h"

#include "TestDoubles.h"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sga::voice;
using sga::voice::test_support::FakeClock;

// 轻量自测断言工具
namespace mini_test {

inline std::string toString(const std::string& v) { return v; }
inline std::string toString(const char* v) { return v ? std::string(v) : "null"; }
inline std::string toString(bool v) { return v ? "true" : "false"; }

template <typename T>
std::string toString(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

#define CHECK_TRUE(cond)                                                                          \
    do {                                                                                          \
        if (!(cond))                                                                              \
            throw mini_test::AssertionFailed(std::string("CHECK_TRUE failed: ") + #cond);         \
    } while (0)

#define CHECK_FALSE(cond) CHECK_TRUE(!(cond))

#define CHECK_EQ(a, b)                                                                            \
    do {                                                                                          \
        const auto _va = (a);                                                                     \
        const auto _vb = (b);                                                                     \
        if (!(_va == _vb)) {                                                                      \
            throw mini_test::AssertionFailed(std::string("CHECK_EQ failed: ") + #a " vs " #b +    \
                                             " (" + mini_test::toString(_va) + " vs " +           \
                                             mini_test::toString(_vb) + ")");                     \
        }                                                                                         \
    } while (0)

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline int run(const std::vector<TestCase>& tests) {
    int failed = 0;
    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[  OK  ] " << t.name << "\n";
        } catch (const AssertionFailed& e) {
            failed++;
            std::cout << "[ FAIL ] " << t.name << " :: " << e.what() << "\n";
        } catch (const std::exception& e) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: " << e.what() << "\n";
        } catch (...) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: unknown exception\n";
        }
    }
    std::cout << "Executed " << tests.size() << " cases, failed " << failed << ".\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini_test

int main() {
    using mini_test::TestCase;
    using std::chrono::milliseconds;

    std::vector<TestCase> tests;

    tests.push_back({"elapsed_follows_time_source", []() {
        FakeClock fake;
        ActivityClock clock(fake.source());
        CHECK_EQ(clock.elapsed().count(), 0);
        fake.advance(milliseconds(1500));
        CHECK_EQ(clock.elapsed().count(), 1500);
        fake.advance(milliseconds(250));
        CHECK_EQ(clock.elapsed().count(), 1750);
    }});

    tests.push_back({"touch_resets_elapsed", []() {
        FakeClock fake;
        ActivityClock clock(fake.source());
        fake.advance(milliseconds(9000));
        clock.touch();
        CHECK_EQ(clock.elapsed().count(), 0);
        CHECK_TRUE(clock.lastActivity() == clock.now());
        fake.advance(milliseconds(10));
        CHECK_EQ(clock.elapsed().count(), 10);
    }});

    tests.push_back({"time_going_backwards_reads_as_zero", []() {
        FakeClock fake;
        ActivityClock clock(fake.source());
        fake.advance(milliseconds(-100));
        CHECK_EQ(clock.elapsed().count(), 0);
    }});

    tests.push_back({"default_source_is_steady_clock", []() {
        ActivityClock clock;
        std::this_thread::sleep_for(milliseconds(20));
        CHECK_TRUE(clock.elapsed() >= milliseconds(20));
        clock.touch();
        CHECK_TRUE(clock.elapsed() < milliseconds(1000));
    }});

    tests.push_back({"concurrent_touch_and_read", []() {
        FakeClock fake;
        ActivityClock clock(fake.source());
        std::thread writer([&]() {
            for (int i = 0; i < 1000; ++i) {
                fake.advance(milliseconds(1));
                clock.touch();
            }
        });
        for (int i = 0; i < 1000; ++i) {
            CHECK_TRUE(clock.elapsed() >= milliseconds(0));
        }
        writer.join();
        CHECK_EQ(clock.elapsed().count(), 0);
    }});

    return mini_test::run(tests);
}
