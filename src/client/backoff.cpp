#include "backoff.hpp"

#include <algorithm>
#include <cmath>

namespace fl::client {

ReconnectBackoff::ReconnectBackoff(int initialMs, int capMs)
    : initialMs_(std::max(1, initialMs)), capMs_(std::max(initialMs_, capMs)), currentMs_(initialMs_) {}

int ReconnectBackoff::next(double multiplier) {
    const int delay = currentMs_;
    const double grown = std::ceil(static_cast<double>(currentMs_) * std::max(1.0, multiplier));
    currentMs_ = static_cast<int>(std::min<double>(capMs_, grown));
    return delay;
}

void ReconnectBackoff::reset() {
    currentMs_ = initialMs_;
}

}  // namespace fl::client
