// src/intake/src/FeePolicy.cpp
#include "intake/include/FeePolicy.hpp"
#include <limits>
#include <stdexcept>

namespace chainsig::intake
{
    FixedFeePolicy::FixedFeePolicy(Balance fee)
        : fee(fee)
    {
        if (fee == 0) {
            throw std::invalid_argument("Minimum fee must be at least 1");
        }
    }

    Balance FixedFeePolicy::MinimumFee(size_t /*pending_requests*/) const
    {
        return fee;
    }

    PendingLoadFeePolicy::PendingLoadFeePolicy(Balance base_fee, uint64_t step)
        : base_fee(base_fee), step(step)
    {
        if (base_fee == 0) {
            throw std::invalid_argument("Base fee must be at least 1");
        }
        if (step == 0) {
            throw std::invalid_argument("Load step must be at least 1");
        }
    }

    Balance PendingLoadFeePolicy::MinimumFee(size_t pending_requests) const
    {
        uint64_t multiplier = 1 + static_cast<uint64_t>(pending_requests) / step;

        // 포화
        if (multiplier > std::numeric_limits<Balance>::max() / base_fee) {
            return std::numeric_limits<Balance>::max();
        }
        return base_fee * multiplier;
    }

    std::unique_ptr<IFeePolicy> CreateFeePolicy(const IntakeSettings& settings)
    {
        switch (settings.fee_policy) {
            case FeePolicyKind::FIXED:
                return std::make_unique<FixedFeePolicy>(settings.min_deposit);
            case FeePolicyKind::PENDING_LOAD:
                return std::make_unique<PendingLoadFeePolicy>(settings.min_deposit, settings.fee_load_step);
            default:
                throw std::invalid_argument("Unsupported fee policy");
        }
    }
}
