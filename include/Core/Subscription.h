#ifndef SUBSCRIPTION_H
#define SUBSCRIPTION_H

#include <functional>
#include <utility>

// Unregisters an observer when reset or destroyed. Move-only.
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : m_unsubscribe(std::move(unsubscribe)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept : m_unsubscribe(std::move(other.m_unsubscribe)) {
        other.m_unsubscribe = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_unsubscribe = std::move(other.m_unsubscribe);
            other.m_unsubscribe = nullptr;
        }
        return *this;
    }

    void reset() {
        if (m_unsubscribe) {
            auto unsubscribe = std::move(m_unsubscribe);
            m_unsubscribe = nullptr;
            unsubscribe();
        }
    }

    bool active() const { return static_cast<bool>(m_unsubscribe); }

  private:
    std::function<void()> m_unsubscribe;
};

#endif // SUBSCRIPTION_H
