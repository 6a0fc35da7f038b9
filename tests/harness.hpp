#pragma once
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// Simple test framework
inline int g_failures = 0;

inline void run_test(const std::string& name, std::function<bool()> test_fn) {
    std::cout << "[RUN] " << name << "... ";
    try {
        if (test_fn()) {
            std::cout << "PASS\n";
        } else {
            std::cout << "FAIL\n";
            g_failures++;
        }
    } catch (const std::exception& e) {
        std::cout << "FAIL (Exception: " << e.what() << ")\n";
        g_failures++;
    } catch (...) {
        std::cout << "FAIL (Unknown Exception)\n";
        g_failures++;
    }
}

/** Prints the reason for a failed check and returns false. */
inline bool fail(const std::string& why) {
    std::cerr << "  Error: " << why << "\n";
    return false;
}

inline int finish(const std::string& suite) {
    std::cout << "\n" << suite << " completed with " << g_failures << " failures.\n";
    return g_failures > 0 ? 1 : 0;
}

using Bytes = std::vector<uint8_t>;
