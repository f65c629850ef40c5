#include "result.hpp"

const char* se_result_name(SE_Result result)
{
    switch (result)
    {
        case SE_Result::Success:
            return "Success";
        case SE_Result::Timeout:
            return "Timeout";
        case SE_Result::AhbTimeout:
            return "AhbTimeout";
        case SE_Result::Exception:
            return "Exception";
        case SE_Result::MalformedBuffer:
            return "MalformedBuffer";
    }
    return "Unknown";
}
