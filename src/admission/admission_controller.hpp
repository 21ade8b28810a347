/**
 * @file admission_controller.hpp
 * @brief Bounded-concurrency gate for in-flight executions.
 *
 * acquire() blocks the calling thread while all permits are held. Waiters
 * are served in arrival order (ticket lock), so no caller starves. There is
 * no acquisition timeout; callers needing one must bound the wait outside.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace codebox {

class AdmissionController;

/**
 * @brief Proof of one held admission slot.
 *
 * Move-only and only mintable by AdmissionController, so a slot cannot be
 * released twice or released without having been acquired. The slot is
 * returned when the permit is destroyed or release() is called.
 */
class AdmissionPermit {
public:
    AdmissionPermit() = default;
    ~AdmissionPermit();

    AdmissionPermit(AdmissionPermit&& other) noexcept;
    AdmissionPermit& operator=(AdmissionPermit&& other) noexcept;
    AdmissionPermit(const AdmissionPermit&) = delete;
    AdmissionPermit& operator=(const AdmissionPermit&) = delete;

    [[nodiscard]] bool held() const noexcept { return owner_ != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return held(); }

    /// Return the slot early. No-op on an empty permit.
    void release() noexcept;

private:
    friend class AdmissionController;
    explicit AdmissionPermit(AdmissionController* owner) noexcept : owner_(owner) {}

    AdmissionController* owner_ = nullptr;
};

class AdmissionController {
public:
    explicit AdmissionController(size_t max_in_flight);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /// Block until a slot is free, then take it.
    [[nodiscard]] AdmissionPermit acquire();

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] size_t waiting() const;
    /// Highest in_flight() observed since construction.
    [[nodiscard]] size_t peak_in_flight() const;

private:
    friend class AdmissionPermit;
    void release_slot() noexcept;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_{0};
    size_t peak_{0};
    uint64_t next_ticket_{0};
    uint64_t serving_ticket_{0};
};

}  // namespace codebox
