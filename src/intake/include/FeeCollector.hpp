// src/intake/include/FeeCollector.hpp
#pragma once
#include "intake/include/FeePolicy.hpp"
#include "intake/include/IntakeErrors.hpp"
#include "host/include/IHostEnvironment.hpp"
#include <string>

namespace chainsig::intake
{
    struct FeeReceipt
    {
        SignError error = SignError::NONE;
        std::string message;
        Balance minimum_fee = 0;
        Balance refund = 0;

        bool IsAccepted() const { return error == SignError::NONE; }
    };

    /**
     * @brief 최소 수수료 징수 및 초과분 환불
     *
     * deposit = minimum_fee + refund, refund > 0 일 때만 송금을 예약합니다.
     * 요청 하나당 한 번만 호출되며 재시도하지 않습니다.
     */
    class FeeCollector
    {
    public:
        FeeCollector(host::IHostEnvironment& host, const IFeePolicy& policy);

        FeeReceipt Collect(Balance attached_deposit, const AccountId& requester, size_t pending_requests);

        const IFeePolicy& Policy() const { return policy; }

    private:
        host::IHostEnvironment& host;
        const IFeePolicy& policy;
    };
}
