#include "pan_series/service/retry.hpp"

#include <cmath>

namespace pan_series::service {

std::chrono::milliseconds RetryPolicy::backoff_after(int attempt) const {
    const double factor = std::pow(std::max(1.0, multiplier), std::max(0, attempt - 1));
    const double ms = static_cast<double>(initial_backoff.count()) * factor;
    const double capped = std::min(ms, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

} // namespace pan_series::service
