#include "runner/admission_gate.hpp"

#include <algorithm>

namespace codejoin::runner {

AdmissionGate::Ticket::~Ticket() {
    Reset();
}

AdmissionGate::Ticket::Ticket(Ticket&& other) noexcept
    : gate_(other.gate_) {
    other.gate_ = nullptr;
}

AdmissionGate::Ticket& AdmissionGate::Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        Reset();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void AdmissionGate::Ticket::Reset() {
    if (gate_) {
        gate_->Release();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(int capacity)
    : capacity_(std::max(1, capacity)) {}

AdmissionGate::Ticket AdmissionGate::TryAcquireFor(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, wait, [this] { return in_use_ < capacity_; })) {
        return Ticket{};
    }
    ++in_use_;
    return Ticket(this);
}

int AdmissionGate::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void AdmissionGate::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
    }
    cv_.notify_one();
}

}  // namespace codejoin::runner
