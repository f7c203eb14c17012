#pragma once

#include "sanctions/storage/i_result_store.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sn::storage {

class InMemoryResultStore final : public IResultStore {
public:
    InMemoryResultStore() = default;

    void store(const core::ScreeningResult& result) override;
    void store(const events::PaymentScreeningResult& result) override;

    std::size_t screeningCount() const;
    std::size_t paymentCount() const;

    // Latest stored result for the payment, if any
    std::optional<events::PaymentScreeningResult> findPayment(const std::string& paymentId) const;
    std::vector<core::ScreeningResult> screenings() const;

private:
    mutable std::mutex mutex_;
    std::vector<core::ScreeningResult> screenings_;
    std::vector<events::PaymentScreeningResult> payments_;
};

} // namespace sn::storage
