#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/result.h"

namespace ireg {

    // 생성 경로(getOrCreate)에서 발생하는 registry 예외의 base.
    // 등록 계열 API 는 Result<void> 로 오류를 반환한다.
    class RegistryException : public std::runtime_error
    {
    public:
        RegistryException(ResultCode code, const std::string& key, const std::string& message);

        ResultCode code() const noexcept { return code_; }
        const std::string& key() const noexcept { return key_; }

    private:
        ResultCode code_;
        std::string key_;
    }; // class RegistryException


    // key 가 이미 생성 중이고 early reference 로 해결되지 않는 순환 참조
    class CurrentlyInCreationException : public RegistryException
    {
    public:
        explicit CurrentlyInCreationException(const std::string& key);
    };


    // 전체 폐기(destroyAll) 중 또는 이후의 생성 요청
    class CreationNotAllowedException : public RegistryException
    {
    public:
        CreationNotAllowedException(const std::string& key, const std::string& message);
    };


    // 상태 불일치.
    // factory 가 던지면 "다른 경로로 객체가 이미 등록되었다" 는 의미로 취급된다.
    class IllegalStateError : public RegistryException
    {
    public:
        IllegalStateError(const std::string& key, const std::string& message);
    };


    // factory 실패. 최상위 getOrCreate 가 중첩 생성 중 누적된
    // 예외(suppressed)를 related cause 로 붙인다.
    class CreationException : public RegistryException
    {
    public:
        CreationException(const std::string& key, const std::string& message,
                          std::exception_ptr cause = nullptr);

        std::exception_ptr cause() const noexcept { return cause_; }

        void addRelatedCause(std::exception_ptr related);
        const std::vector<std::exception_ptr>& relatedCauses() const noexcept { return related_causes_; }

        // cause 와 related cause 의 메시지를 포함한 전체 설명
        std::string describe() const;

    private:
        std::exception_ptr cause_;
        std::vector<std::exception_ptr> related_causes_;
    }; // class CreationException


    // exception_ptr 의 메시지. std::exception 계열이 아니면 "<unknown exception>"
    std::string describeException(const std::exception_ptr& ex);

}; // namespace ireg
