#include "HardwareProfile.hpp"
#include "Logger.hpp"

#include <thread>
#include <unistd.h>

namespace
{
    constexpr uint64_t GiB = 1024ULL * 1024 * 1024;

    //                       hash copyLocal copyNet validateLocal validateNet
    const WorkerLimits LowLimits    {  2,  4, 2,  2, 2 };
    const WorkerLimits MediumLimits {  4,  8, 3,  4, 3 };
    const WorkerLimits HighLimits   {  8, 16, 4,  8, 4 };
    const WorkerLimits BeastLimits  { 16, 24, 6, 16, 6 };
}

size_t WorkerLimits::CopyWorkersFor(TransportClass Transport) const
{
    return Transport == TransportClass::Network ? CopyWorkersNetwork : CopyWorkersLocal;
}

size_t WorkerLimits::ValidateWorkersFor(TransportClass Transport) const
{
    return Transport == TransportClass::Network ? ValidateWorkersNetwork : ValidateWorkersLocal;
}

std::string TierToString(CapabilityTier Tier)
{
    switch (Tier)
    {
    case CapabilityTier::Low:    return "Low";
    case CapabilityTier::Medium: return "Medium";
    case CapabilityTier::High:   return "High";
    case CapabilityTier::Beast:  return "Beast";
    default:                     return "Unknown";
    }
}

bool TierFromString(const std::string& Value, CapabilityTier& OutTier)
{
    if (Value == "Low")
    {
        OutTier = CapabilityTier::Low;
    }
    else if (Value == "Medium")
    {
        OutTier = CapabilityTier::Medium;
    }
    else if (Value == "High")
    {
        OutTier = CapabilityTier::High;
    }
    else if (Value == "Beast")
    {
        OutTier = CapabilityTier::Beast;
    }
    else
    {
        return false;
    }
    return true;
}

namespace HardwareProfile
{
    MachineCapabilities ProbeMachine()
    {
        MachineCapabilities Machine;
        Machine.CpuCores = std::thread::hardware_concurrency();

        long Pages = sysconf(_SC_PHYS_PAGES);
        long PageSize = sysconf(_SC_PAGE_SIZE);
        if (Pages > 0 && PageSize > 0)
        {
            Machine.TotalMemoryBytes = static_cast<uint64_t>(Pages) * static_cast<uint64_t>(PageSize);
        }
        return Machine;
    }

    CapabilityTier TierFor(const MachineCapabilities& Machine)
    {
        const uint64_t Memory = Machine.TotalMemoryBytes;

        if (Machine.CpuCores >= 20 && Memory >= 48 * GiB)
        {
            return CapabilityTier::Beast;
        }
        if (Machine.CpuCores >= 10 && Memory >= 16 * GiB)
        {
            return CapabilityTier::High;
        }
        if (Machine.CpuCores >= 4 && Memory >= 8 * GiB)
        {
            return CapabilityTier::Medium;
        }
        return CapabilityTier::Low;
    }

    WorkerLimits LimitsFor(CapabilityTier Tier)
    {
        switch (Tier)
        {
        case CapabilityTier::Beast:  return BeastLimits;
        case CapabilityTier::High:   return HighLimits;
        case CapabilityTier::Medium: return MediumLimits;
        case CapabilityTier::Low:
        default:                     return LowLimits;
        }
    }

    CapabilityTier ResolveTier(const std::string& ConfiguredTier)
    {
        CapabilityTier Tier;
        if (TierFromString(ConfiguredTier, Tier))
        {
            Log.Info(std::string("[HardwareProfile] Tier forced by config: ") + TierToString(Tier));
            return Tier;
        }

        MachineCapabilities Machine = ProbeMachine();
        Tier = TierFor(Machine);
        Log.Info(std::string("[HardwareProfile] Detected ") + TierToString(Tier) + " tier: " + std::to_string(Machine.CpuCores) +
            " cores, " + std::to_string(Machine.TotalMemoryBytes / GiB) + " GiB RAM");
        return Tier;
    }
}
