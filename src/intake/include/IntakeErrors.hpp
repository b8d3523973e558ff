// src/intake/include/IntakeErrors.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace chainsig::intake
{
    /**
     * @brief sign 호출이 호출자에게 동기적으로 돌려주는 파라미터 에러
     *
     * 모두 상태 변경 전에 검출되며 재시도하지 않습니다.
     */
    enum class SignError : uint8_t
    {
        NONE = 0,
        DOMAIN_NOT_FOUND = 1,
        PAYLOAD_CURVE_MISMATCH = 2,
        INVALID_PAYLOAD = 3,
        INSUFFICIENT_GAS = 4,
        INSUFFICIENT_DEPOSIT = 5,
        MALFORMED_REQUEST = 6
    };

    inline const char* ToString(SignError error)
    {
        switch (error) {
            case SignError::NONE: return "None";
            case SignError::DOMAIN_NOT_FOUND: return "DomainNotFound";
            case SignError::PAYLOAD_CURVE_MISMATCH: return "PayloadCurveMismatch";
            case SignError::INVALID_PAYLOAD: return "InvalidPayload";
            case SignError::INSUFFICIENT_GAS: return "InsufficientGas";
            case SignError::INSUFFICIENT_DEPOSIT: return "InsufficientDeposit";
            case SignError::MALFORMED_REQUEST: return "MalformedRequest";
            default: return "Unknown";
        }
    }

    /**
     * @brief respond 호출 결과
     */
    enum class RespondStatus : uint8_t
    {
        RESUMED = 0,            // 정상 서명으로 재개 요청
        RESUMED_MALFORMED = 1,  // 형식이 잘못된 응답 → Failure(MalformedResult) 로 재개 요청
        REQUEST_NOT_FOUND = 2,  // 대기 중인 요청 없음
        ALREADY_RESOLVED = 3,   // continuation 이 이미 재개 요청됨
        RESUME_QUEUE_FULL = 4   // 호스트 resume 큐가 가득 참, 나중에 다시 응답해야 함
    };

    inline const char* ToString(RespondStatus status)
    {
        switch (status) {
            case RespondStatus::RESUMED: return "Resumed";
            case RespondStatus::RESUMED_MALFORMED: return "ResumedMalformed";
            case RespondStatus::REQUEST_NOT_FOUND: return "RequestNotFound";
            case RespondStatus::ALREADY_RESOLVED: return "AlreadyResolved";
            case RespondStatus::RESUME_QUEUE_FULL: return "ResumeQueueFull";
            default: return "Unknown";
        }
    }

    /**
     * @brief 내부 일관성 오류 (토큰 누락, continuation 인자 해석 실패 등)
     *
     * 해당 호출은 중단되고 호스트가 그 호출의 변경을 모두 되돌립니다.
     */
    class IntakeFault : public std::runtime_error
    {
    public:
        explicit IntakeFault(const std::string& msg)
            : std::runtime_error("Intake fault: " + msg) {}
    };
}
