#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace sortedsum {

class ScopedTimer {
public:
    using clock_type = std::chrono::steady_clock;

    ScopedTimer() : begin_(clock_type::now()) { }

    // prints label and the elapsed time on destruction
    explicit ScopedTimer(std::string label) : label_(std::move(label)), begin_(clock_type::now()) { }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator= (const ScopedTimer&) = delete;

    ~ScopedTimer() {
        if (!label_.empty())
            std::cout << label_ << " Time elapsed: " << elapsedSeconds() << "s" << std::endl;
    }

    [[nodiscard]] double elapsedSeconds() const {
        return std::chrono::duration<double>(clock_type::now() - begin_).count();
    }

    void reset() {
        begin_ = clock_type::now();
    }

private:
    std::string label_;
    clock_type::time_point begin_;
};

}
