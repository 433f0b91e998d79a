// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_MINING_PRIORITIZER_HPP
#define LEDGERSIM_MINING_PRIORITIZER_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace ledgersim::mining {

/// One job at a time. A pending high job (block production) goes before
/// any low job (submission, query) that has not started yet.
class prioritizer {
public:
    using unique_lock_t = std::unique_lock<std::mutex>;

    prioritizer() = default;

    prioritizer(prioritizer const&) = delete;
    prioritizer operator=(prioritizer const&) = delete;

    template <typename F>
    auto low_job(F f) const {
        unique_lock_t lk(gate_);
        cv_.wait(lk, [&]{ return waiting_ == 0; });
        return f();
    }

    template <typename F>
    auto high_job(F f) const {
        ++waiting_;
        unique_lock_t lk(gate_);
        --waiting_;
        // Wakes the low jobs parked while this one was waiting.
        cv_.notify_all();
        return f();
    }

private:
    mutable std::condition_variable cv_;
    mutable std::mutex gate_;
    mutable std::atomic<int> waiting_ {0};
};

} // namespace ledgersim::mining

#endif
