/**
 * @file StdoutReservation.hpp
 * @brief Keeps stdout clean for a document written with `--output -`
 */

#pragma once

#include <iostream>
#include <ostream>
#include <streambuf>

namespace geocircle {

/**
 * @brief Diverts console logging from stdout to stderr while alive
 *
 * Everything written to std::cout while an instance exists lands on
 * std::cerr. The stream returned by data() writes to the buffer std::cout
 * had on construction. The original buffer is restored on destruction.
 */
class StdoutReservation {
public:
    StdoutReservation()
        : stdoutBuffer_(std::cout.rdbuf())
        , data_(stdoutBuffer_) {
        std::cout.flush();
        std::cout.rdbuf(std::cerr.rdbuf());
    }

    ~StdoutReservation() {
        data_.flush();
        std::cout.rdbuf(stdoutBuffer_);
    }

    StdoutReservation(const StdoutReservation&) = delete;
    StdoutReservation& operator=(const StdoutReservation&) = delete;

    std::ostream& data() { return data_; }

private:
    std::streambuf* stdoutBuffer_;
    std::ostream data_;
};

} // namespace geocircle
