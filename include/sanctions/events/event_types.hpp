#pragma once

#include "sanctions/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sn::events {

enum class PaymentStatus : std::uint8_t {
    Received,   // dequeued from the transport
    Screening,  // sender and recipient in flight
    Cleared,    // terminal
    Review,     // terminal
    Blocked,    // terminal
    Error       // terminal, fail-closed
};

using WallClock = std::chrono::system_clock::time_point;

// Known optional payment attributes plus one opaque passthrough blob
struct PaymentMetadata final {
    std::optional<std::string> senderAccount;
    std::optional<std::string> recipientAccount;
    std::optional<std::string> reference;
    std::optional<std::string> channel;
    std::optional<std::string> purpose;
    std::string extension;
};

struct PaymentEvent final {
    std::string paymentId;
    std::string transactionId;
    std::string senderName;
    std::optional<std::string> senderCountry;
    std::string recipientName;
    std::optional<std::string> recipientCountry;
    double amount{0.0};
    std::string currency;
    std::string paymentType{"wire_transfer"};
    WallClock ts{};
    PaymentMetadata metadata;
};

struct ResultMetadata final {
    std::string paymentType;
    double amount{0.0};
    std::string currency;
    std::optional<std::string> error; // present when status == Error
};

struct PaymentScreeningResult final {
    std::string paymentId;
    std::string transactionId;
    std::uint64_t screeningId{0};
    std::optional<core::ScreeningResult> sender;     // absent when that side failed
    std::optional<core::ScreeningResult> recipient;
    double riskScore{0.0};
    core::Decision decision{core::Decision::Clear};
    PaymentStatus status{PaymentStatus::Received};
    core::Latency processingTime{0};
    ResultMetadata metadata;
};

// A result as it leaves the core: routing key for topic exchanges,
// partition key (the payment id) for partitioned logs
struct PublishedResult final {
    std::string routingKey;
    std::string partitionKey;
    PaymentScreeningResult result;
};

constexpr const char* toString(PaymentStatus s) noexcept {
    switch (s) {
        case PaymentStatus::Received:  return "received";
        case PaymentStatus::Screening: return "screening";
        case PaymentStatus::Cleared:   return "cleared";
        case PaymentStatus::Review:    return "review";
        case PaymentStatus::Blocked:   return "blocked";
        case PaymentStatus::Error:     return "error";
    }
    return "unknown";
}

constexpr bool isTerminal(PaymentStatus s) noexcept {
    return s == PaymentStatus::Cleared || s == PaymentStatus::Review ||
           s == PaymentStatus::Blocked || s == PaymentStatus::Error;
}

} // namespace sn::events
