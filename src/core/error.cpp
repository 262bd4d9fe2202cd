#include <vecanim/error.hpp>

namespace vecanim
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::InvalidAnimationData:
            return "INVALID_ANIMATION_DATA";
        case ErrorCode::InvalidOperation:
            return "INVALID_OPERATION";
        case ErrorCode::InvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::StateMachineError:
            return "STATE_MACHINE_ERROR";
        case ErrorCode::PluginError:
            return "PLUGIN_ERROR";
    }
    return "UNKNOWN";
}

}  // namespace vecanim
