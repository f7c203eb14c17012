#include "sanctions/storage/in_memory_result_store.hpp"

#include <algorithm>

namespace sn::storage {

void InMemoryResultStore::store(const core::ScreeningResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    screenings_.push_back(result);
}

void InMemoryResultStore::store(const events::PaymentScreeningResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    payments_.push_back(result);
}

std::size_t InMemoryResultStore::screeningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return screenings_.size();
}

std::size_t InMemoryResultStore::paymentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payments_.size();
}

std::optional<events::PaymentScreeningResult> InMemoryResultStore::findPayment(const std::string& paymentId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(payments_.rbegin(), payments_.rend(),
        [&paymentId](const events::PaymentScreeningResult& r) { return r.paymentId == paymentId; });
    if (it == payments_.rend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<core::ScreeningResult> InMemoryResultStore::screenings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return screenings_;
}

} // namespace sn::storage
