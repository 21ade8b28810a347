/**
 * @file admission_controller.cpp
 * @brief AdmissionController implementation (ticket-ordered counting gate).
 */

#include "admission/admission_controller.hpp"

#include <algorithm>

namespace codebox {

// ─────────────────────────────────────────────
// AdmissionPermit
// ─────────────────────────────────────────────

AdmissionPermit::~AdmissionPermit() {
    release();
}

AdmissionPermit::AdmissionPermit(AdmissionPermit&& other) noexcept
    : owner_(other.owner_) {
    other.owner_ = nullptr;
}

AdmissionPermit& AdmissionPermit::operator=(AdmissionPermit&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void AdmissionPermit::release() noexcept {
    if (owner_ != nullptr) {
        auto* owner = owner_;
        owner_ = nullptr;
        owner->release_slot();
    }
}

// ─────────────────────────────────────────────
// AdmissionController
// ─────────────────────────────────────────────

AdmissionController::AdmissionController(size_t max_in_flight)
    : capacity_(std::max<size_t>(max_in_flight, 1)) {}

AdmissionPermit AdmissionController::acquire() {
    std::unique_lock lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&] {
        return ticket == serving_ticket_ && in_flight_ < capacity_;
    });

    ++serving_ticket_;
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    lock.unlock();

    // The next ticket holder may also fit.
    cv_.notify_all();
    return AdmissionPermit{this};
}

void AdmissionController::release_slot() noexcept {
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
    }
    cv_.notify_all();
}

size_t AdmissionController::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

size_t AdmissionController::waiting() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(next_ticket_ - serving_ticket_);
}

size_t AdmissionController::peak_in_flight() const {
    std::lock_guard lock(mutex_);
    return peak_;
}

}  // namespace codebox
