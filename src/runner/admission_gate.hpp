#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace codejoin::runner {

// Host-wide cap on live sandboxes, shared by batch runs and terminal sessions.
class AdmissionGate {
public:
    // Holds one slot until destroyed or reset.
    class Ticket {
    public:
        Ticket() = default;
        ~Ticket();
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        bool Valid() const { return gate_ != nullptr; }
        void Reset();

    private:
        friend class AdmissionGate;
        explicit Ticket(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(int capacity);

    // Returns an invalid ticket if no slot frees up within wait.
    Ticket TryAcquireFor(std::chrono::milliseconds wait);

    int InUse() const;
    int Capacity() const { return capacity_; }

private:
    void Release();

    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int in_use_ = 0;
};

}  // namespace codejoin::runner
