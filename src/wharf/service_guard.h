#pragma once

#include <optional>

namespace Wharf {

class ServiceToken;

/**
 * ServiceGuard admits one service or overweight execution at a time.
 * Holding a ServiceToken is the proof that the caller owns the queue state.
 */
class ServiceGuard {
public:
    ServiceGuard() = default;
    ServiceGuard(const ServiceGuard&) = delete;
    ServiceGuard& operator=(const ServiceGuard&) = delete;

    // Empty if a token is already out
    std::optional<ServiceToken> TryAcquire();

    bool held() const { return held_; }

private:
    friend class ServiceToken;
    bool held_ = false;
};

/**
 * Move-only token; releases its guard when destroyed
 */
class ServiceToken {
public:
    ~ServiceToken() { Release(); }

    ServiceToken(const ServiceToken&) = delete;
    ServiceToken& operator=(const ServiceToken&) = delete;

    ServiceToken(ServiceToken&& other) noexcept : guard_(other.guard_) {
        other.guard_ = nullptr;
    }
    ServiceToken& operator=(ServiceToken&& other) noexcept {
        if (this != &other) {
            Release();
            guard_ = other.guard_;
            other.guard_ = nullptr;
        }
        return *this;
    }

private:
    friend class ServiceGuard;
    explicit ServiceToken(ServiceGuard* guard) : guard_(guard) {}

    void Release() {
        if (guard_) {
            guard_->held_ = false;
            guard_ = nullptr;
        }
    }

    ServiceGuard* guard_;
};

inline std::optional<ServiceToken> ServiceGuard::TryAcquire() {
    if (held_) {
        return std::nullopt;
    }
    held_ = true;
    return ServiceToken(this);
}

} // namespace Wharf
