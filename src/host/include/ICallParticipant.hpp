// src/host/include/ICallParticipant.hpp
#pragma once

namespace chainsig::host
{
    /**
     * @brief 호출 단위 all-or-nothing 에 참여하는 상태 보유자
     *
     * 호스트는 호출 시작/성공/중단 시점에 알려주고,
     * 중단 시 참여자는 그 호출 중 수행한 변경을 모두 되돌려야 합니다.
     */
    class ICallParticipant
    {
    public:
        virtual ~ICallParticipant() = default;

        virtual void OnCallBegin() = 0;
        virtual void OnCallCommit() = 0;
        virtual void OnCallAbort() = 0;
    };
}
