#pragma once

#include <stdexcept>
#include <string>

namespace vecanim
{

enum class ErrorCode
{
    InvalidAnimationData,
    InvalidOperation,
    InvalidArgument,
    StateMachineError,
    PluginError,
};

const char* error_code_name(ErrorCode code);

// Runtime, state machine and plugin failures. Scene graph and timeline argument
// errors use std::invalid_argument / std::out_of_range instead.
class Error : public std::runtime_error
{
   public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const noexcept { return code_; }

   private:
    ErrorCode code_;
};

}  // namespace vecanim
