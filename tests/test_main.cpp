
// tests/test_main.cpp
#include "test_framework.hpp"

// All tests register themselves via static initializers in the other
// translation units. Optional argv[1]: run only tests whose name contains it.
int main(int argc, char** argv) {
    const std::string filter = argc > 1 ? argv[1] : "";
    const auto& tests = tfw::registry();
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tests) {
        if (!filter.empty() && test.name.find(filter) == std::string::npos) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::steady_clock::now();
        try {
            test.fn();
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            std::cout << "[       OK ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << elapsed.count() << "s)" << std::endl;
        } catch (const std::exception& e) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << elapsed.count() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return (passed == ran) ? 0 : 1;
}
