#ifndef LINKBENCH_TEST_EVENTUALLY_HPP
#define LINKBENCH_TEST_EVENTUALLY_HPP

#include <chrono>
#include <thread>

namespace linkbench::test {

// Poll `predicate` until it holds or `timeout` expires; returns its last value
template<typename Predicate>
bool eventually(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
                std::chrono::milliseconds poll = std::chrono::milliseconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(poll);
    }
    return predicate();
}

} // namespace linkbench::test

#endif // LINKBENCH_TEST_EVENTUALLY_HPP
