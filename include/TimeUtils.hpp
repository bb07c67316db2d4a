#pragma once

#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdint>

//UNIX Time since Epoch, in seconds
inline int64_t ToUnixSeconds(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    auto SystemTime = time_point_cast<system_clock::duration>(FTime - std::filesystem::file_time_type::clock::now() + system_clock::now());
    return duration_cast<seconds>(SystemTime.time_since_epoch()).count();
}

inline int64_t NowUnixSeconds()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
