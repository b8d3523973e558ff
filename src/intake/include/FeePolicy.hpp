// src/intake/include/FeePolicy.hpp
#pragma once
#include "intake/include/IntakeSettings.hpp"
#include <memory>

namespace chainsig::intake
{
    /**
     * @brief 요청당 최소 수수료 정책
     *
     * FeeCollector 계약은 그대로 두고 수수료 계산만 교체할 수 있습니다.
     */
    class IFeePolicy
    {
    public:
        virtual ~IFeePolicy() = default;

        /**
         * @param pending_requests 현재 대기 중인 요청 수
         */
        virtual Balance MinimumFee(size_t pending_requests) const = 0;
        virtual const char* Name() const = 0;
    };

    /**
     * @brief 고정 수수료
     */
    class FixedFeePolicy : public IFeePolicy
    {
    public:
        explicit FixedFeePolicy(Balance fee);

        Balance MinimumFee(size_t pending_requests) const override;
        const char* Name() const override { return "fixed"; }

    private:
        Balance fee;
    };

    /**
     * @brief 대기 요청 수에 따라 증가하는 수수료
     *
     * fee = base * (1 + pending_requests / step)
     */
    class PendingLoadFeePolicy : public IFeePolicy
    {
    public:
        PendingLoadFeePolicy(Balance base_fee, uint64_t step);

        Balance MinimumFee(size_t pending_requests) const override;
        const char* Name() const override { return "load"; }

    private:
        Balance base_fee;
        uint64_t step;
    };

    std::unique_ptr<IFeePolicy> CreateFeePolicy(const IntakeSettings& settings);
}
