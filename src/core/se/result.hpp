#ifndef SE_RESULT_HPP
#define SE_RESULT_HPP

enum class SE_Result
{
    Success,
    Timeout,
    AhbTimeout,
    Exception,
    MalformedBuffer
};

const char* se_result_name(SE_Result result);

#endif // SE_RESULT_HPP
