#pragma once

#include "sanctions/core/types.hpp"
#include "sanctions/events/event_types.hpp"

namespace sn::storage {

// Optional persistence sink. Callers treat it as fire-and-forget: a throw
// is logged and otherwise ignored.
class IResultStore {
public:
    virtual ~IResultStore() = default;
    virtual void store(const core::ScreeningResult& result) = 0;
    virtual void store(const events::PaymentScreeningResult& result) = 0;
};

} // namespace sn::storage
