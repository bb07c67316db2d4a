#include "RetryPolicy.hpp"
#include "ConfigGlobal.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

RetryPolicy RetryPolicy::FromConfig()
{
    RetryPolicy Policy;
    Policy.MaxRetries = ConfigGlobal::MaxRetries;
    Policy.DelaysMs = ConfigGlobal::RetryDelaysMs;
    return Policy;
}

RetryPolicy RetryPolicy::NoDelay(unsigned int Retries)
{
    RetryPolicy Policy;
    Policy.MaxRetries = Retries;
    Policy.DelaysMs = { 0 };
    return Policy;
}

bool RetryPolicy::IsTransientError(int ErrorCode)
{
    switch (ErrorCode)
    {
    case ECONNRESET:
    case ETIMEDOUT:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EPIPE:
    case EIO:
    case ENETUNREACH:
    case EBUSY:
        return true;
    default:
        return false;
    }
}

uint32_t RetryPolicy::DelayForAttempt(unsigned int Attempt) const
{
    if (DelaysMs.empty())
    {
        return 0;
    }
    if (Attempt >= DelaysMs.size())
    {
        return DelaysMs.back();
    }
    return DelaysMs[Attempt];
}

bool RetryPolicy::WaitBeforeRetry(unsigned int Attempt, const std::atomic<bool>* Cancelled) const
{
    using namespace std::chrono;

    const auto Deadline = steady_clock::now() + milliseconds(DelayForAttempt(Attempt));
    while (steady_clock::now() < Deadline)
    {
        if (Cancelled != nullptr && Cancelled->load())
        {
            return false;
        }
        std::this_thread::sleep_for(std::min<steady_clock::duration>(milliseconds(50), Deadline - steady_clock::now()));
    }
    return Cancelled == nullptr || !Cancelled->load();
}
