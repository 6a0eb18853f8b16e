#include "registry_error.hpp"

#include <fmt/format.h>

namespace ireg {

RegistryException::RegistryException(ResultCode code, const std::string& key, const std::string& message)
    : std::runtime_error(message)
    , code_(code)
    , key_(key)
{
}

CurrentlyInCreationException::CurrentlyInCreationException(const std::string& key)
    : RegistryException(ResultCode::CurrentlyInCreation, key,
        fmt::format("Error creating instance '{}': requested instance is currently in creation: "
                    "is there an unresolvable circular reference?", key))
{
}

CreationNotAllowedException::CreationNotAllowedException(const std::string& key, const std::string& message)
    : RegistryException(ResultCode::CreationNotAllowed, key,
        fmt::format("Error creating instance '{}': {}", key, message))
{
}

IllegalStateError::IllegalStateError(const std::string& key, const std::string& message)
    : RegistryException(ResultCode::InvalidState, key, message)
{
}

CreationException::CreationException(const std::string& key, const std::string& message,
                                     std::exception_ptr cause)
    : RegistryException(ResultCode::Fail, key,
        fmt::format("Error creating instance '{}': {}", key, message))
    , cause_(std::move(cause))
{
}

void CreationException::addRelatedCause(std::exception_ptr related)
{
    if (related) related_causes_.push_back(std::move(related));
}

std::string CreationException::describe() const
{
    std::string out = what();
    if (cause_) {
        out += fmt::format("; nested exception is {}", describeException(cause_));
    }
    for (const auto& related : related_causes_) {
        out += fmt::format("\nRelated cause: {}", describeException(related));
    }
    return out;
}

std::string describeException(const std::exception_ptr& ex)
{
    if (!ex) return "<none>";
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "<unknown exception>";
    }
}

} // namespace ireg
