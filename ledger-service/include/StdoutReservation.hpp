#pragma once

#include <iostream>
#include <ostream>
#include <streambuf>

namespace ledger {

/**
 * @brief Резервирует stdout под JSON результата
 *
 * Пока объект жив, всё, что пишется в std::cout, уходит в std::cerr;
 * result() пишет в настоящий stdout. Если active == false, ничего
 * не перенаправляется.
 */
class StdoutReservation {
public:
    explicit StdoutReservation(bool active)
        : stdoutBuffer_(std::cout.rdbuf())
        , result_(stdoutBuffer_)
        , active_(active)
    {
        if (active_) {
            std::cout.rdbuf(std::cerr.rdbuf());
        }
    }

    ~StdoutReservation() {
        if (active_) {
            std::cout.rdbuf(stdoutBuffer_);
        }
    }

    StdoutReservation(const StdoutReservation&) = delete;
    StdoutReservation& operator=(const StdoutReservation&) = delete;

    std::ostream& result() { return result_; }

private:
    std::streambuf* stdoutBuffer_;
    std::ostream result_;
    bool active_;
};

} // namespace ledger
