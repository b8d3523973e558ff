// src/intake/src/FeeCollector.cpp
#include "intake/include/FeeCollector.hpp"
#include "common/utils/logger/Logger.hpp"

namespace chainsig::intake
{
    FeeCollector::FeeCollector(host::IHostEnvironment& host, const IFeePolicy& policy)
        : host(host), policy(policy)
    {
    }

    FeeReceipt FeeCollector::Collect(Balance attached_deposit, const AccountId& requester, size_t pending_requests)
    {
        FeeReceipt receipt;
        receipt.minimum_fee = policy.MinimumFee(pending_requests);

        if (attached_deposit < receipt.minimum_fee) {
            receipt.error = SignError::INSUFFICIENT_DEPOSIT;
            receipt.message = "Require a deposit of " + std::to_string(receipt.minimum_fee) +
                              " yoctonear, found: " + std::to_string(attached_deposit);
            return receipt;
        }

        receipt.refund = attached_deposit - receipt.minimum_fee;
        if (receipt.refund > 0) {
            LOG_INFOF("FeeCollector", "refund excess deposit %llu to %s",
                static_cast<unsigned long long>(receipt.refund), requester.c_str());
            host.ScheduleTransfer(requester, receipt.refund);
        }

        return receipt;
    }
}
