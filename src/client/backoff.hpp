#pragma once

namespace fl::client {

constexpr int kInitialBackoffMs = 500;
constexpr int kMaxBackoffMs = 5000;
constexpr double kFailureMultiplier = 1.7;
constexpr double kDropMultiplier = 1.5;

class ReconnectBackoff {
public:
    ReconnectBackoff(int initialMs = kInitialBackoffMs, int capMs = kMaxBackoffMs);

    // Returns the delay to wait now and grows the next one by `multiplier`.
    int next(double multiplier = kFailureMultiplier);
    void reset();

    int currentMs() const { return currentMs_; }
    int initialMs() const { return initialMs_; }
    int capMs() const { return capMs_; }

private:
    int initialMs_;
    int capMs_;
    int currentMs_;
};

}  // namespace fl::client
