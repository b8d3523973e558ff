// src/service/IntakeCommandHandler.hpp
#pragma once
#include "host/include/LocalHost.hpp"
#include "intake/include/SignService.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace chainsig::service
{
    /**
     * @brief JSON-lines 명령 처리기
     *
     * 한 줄에 명령 하나, 응답도 한 줄입니다.
     *
     *   {"cmd":"sign","caller":"alice.near","deposit":1,"gas":300000000000000,"args":{...}}
     *   {"cmd":"respond","signer":"mpc.near","request":{...},"response":{...}}
     *   {"cmd":"advance","blocks":200}
     *   {"cmd":"pending","request":{...}}
     *   {"cmd":"delivery","token":"<hex>"}
     *   {"cmd":"public_key","domain_id":0}
     *   {"cmd":"latest_key_version"}
     *
     * sign/respond 는 호스트 호출 하나로 실행되며, 내부 오류가 나면 그 호출의 변경은 모두 버려집니다.
     * respond 와 advance 뒤에는 쌓인 resume 을 바로 처리합니다.
     */
    class IntakeCommandHandler
    {
    public:
        IntakeCommandHandler(host::LocalHost& host, intake::SignService& service);

        std::string HandleLine(const std::string& line);
        nlohmann::json Handle(const nlohmann::json& command);

    private:
        nlohmann::json HandleSign(const nlohmann::json& command);
        nlohmann::json HandleRespond(const nlohmann::json& command);
        nlohmann::json HandleAdvance(const nlohmann::json& command);
        nlohmann::json HandlePending(const nlohmann::json& command);
        nlohmann::json HandleDelivery(const nlohmann::json& command);
        nlohmann::json HandlePublicKey(const nlohmann::json& command);
        nlohmann::json HandleLatestKeyVersion();

        static nlohmann::json Error(const std::string& error, const std::string& message);

        host::LocalHost& host;
        intake::SignService& service;
    };
}
