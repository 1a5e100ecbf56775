#ifndef TABWRIGHT_TESTS_TEST_FRAMEWORK_HPP
#define TABWRIGHT_TESTS_TEST_FRAMEWORK_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabwright {
namespace tests {

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

class TestFailure : public std::runtime_error {
public:
    explicit TestFailure(const std::string& what) : std::runtime_error(what) {}
};

inline void require(bool condition, const std::string& message) {
    if (!condition) {
        throw TestFailure(message);
    }
}

// Runs `fn` and checks it throws E; returns the message
template<typename E, typename F>
std::string require_throws(F fn, const std::string& message) {
    try {
        fn();
    } catch (const E& e) {
        return e.what();
    }
    throw TestFailure(message);
}

} // namespace tests
} // namespace tabwright

#endif // TABWRIGHT_TESTS_TEST_FRAMEWORK_HPP
