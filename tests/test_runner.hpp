#pragma once

#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace razdel_test {

// Minimal runner shared by the test executables: PASSED/FAILED per case and a summary.
class TestRunner {
public:
    void runTest(const std::string& name, std::function<bool()> test) {
        std::cout << "  " << name << "... ";
        try {
            if (test()) {
                std::cout << "PASSED" << std::endl;
                passCount++;
            } else {
                std::cout << "FAILED" << std::endl;
                failCount++;
            }
        } catch (const std::exception& e) {
            std::cout << "FAILED (exception: " << e.what() << ")" << std::endl;
            failCount++;
        }
    }

    void printSummary() const {
        std::cout << "================================" << std::endl;
        std::cout << "Results: " << passCount << " passed, " << failCount << " failed" << std::endl;
    }

    int getFailCount() const { return failCount; }

protected:
    int passCount = 0;
    int failCount = 0;
};

template <typename T>
bool vectorsEqual(const std::vector<T>& a, const std::vector<T>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

inline bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

// Prints both sides when a comparison fails
template <typename T>
bool expectEqual(const T& actual, const T& expected) {
    if (actual == expected) return true;
    std::cerr << "\n    expected " << expected << ", got " << actual << std::endl;
    return false;
}

inline std::string join(const std::vector<size_t>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(values[i]);
    }
    return out + "]";
}

} // namespace razdel_test
