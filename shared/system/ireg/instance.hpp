#pragma once

#include <functional>
#include <memory>
#include <string>

#include "basis_typeinfo.hpp"

namespace ireg {

    // Registry 가 관리하는 객체 handle.
    // 객체의 소유권을 공유하며 등록될 때의 타입(TypeId)을 함께 기억한다.
    class Instance
    {
    public:
        Instance() = default;

        template<typename T>
        static Instance of(std::shared_ptr<T> object)
        {
            Instance instance;
            if (object) {
                instance.type_ = getTypeId<T>();
                instance.object_ = std::static_pointer_cast<void>(std::move(object));
            }
            return instance;
        }

        // 등록된 타입과 T 가 다르면 nullptr
        template<typename T>
        std::shared_ptr<T> as() const
        {
            if (!object_ || type_ != getTypeId<T>())
                return nullptr;
            return std::static_pointer_cast<T>(object_);
        }

        const void* get() const { return object_.get(); }
        TypeId type() const { return type_; }
        std::string typeName() const { return static_cast<std::string>(type_); }

        explicit operator bool() const { return object_ != nullptr; }

        // 동일 객체 여부 (타입까지 같아야 한다)
        bool operator==(const Instance& other) const
        {
            return object_ == other.object_ && type_ == other.type_;
        }
        bool operator!=(const Instance& other) const { return !(*this == other); }

    private:
        std::shared_ptr<void> object_;
        TypeId type_;
    }; // class Instance


    // 객체 생성 callback. 외부(collaborator)에서 제공한다.
    using InstanceFactory = std::function<Instance()>;

    // 객체 폐기 callback. destroy 시 한번만 호출된다.
    using DisposalCallback = std::function<void()>;

}; // namespace ireg
