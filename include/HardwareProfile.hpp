#pragma once

#include <string>
#include <cstdint>

#include "TransportClassifier.hpp"

enum class CapabilityTier
{
    Low,
    Medium,
    High,
    Beast
};

std::string TierToString(CapabilityTier Tier);
bool TierFromString(const std::string& Value, CapabilityTier& OutTier);

// Worker counts per pipeline phase. Network counts are bounded by what a
// remote-file protocol tolerates concurrently, not by bandwidth.
struct WorkerLimits
{
    size_t HashWorkers = 1;
    size_t CopyWorkersLocal = 1;
    size_t CopyWorkersNetwork = 1;
    size_t ValidateWorkersLocal = 1;
    size_t ValidateWorkersNetwork = 1;

    size_t CopyWorkersFor(TransportClass Transport) const;
    size_t ValidateWorkersFor(TransportClass Transport) const;
};

struct MachineCapabilities
{
    unsigned int CpuCores = 0;
    uint64_t TotalMemoryBytes = 0;
};

namespace HardwareProfile
{
    MachineCapabilities ProbeMachine();
    CapabilityTier TierFor(const MachineCapabilities& Machine);

    // Static table lookup, never computed per file.
    WorkerLimits LimitsFor(CapabilityTier Tier);

    // Honors a forced tier from config ("Auto" probes the machine).
    CapabilityTier ResolveTier(const std::string& ConfiguredTier);
}
