#pragma once

#include <string>
#include <vector>

enum class TransportClass
{
    Local,
    Network
};

std::string TransportToString(TransportClass Transport);

struct TransportRules
{
    std::vector<std::string> NetworkRoots;
    std::vector<std::string> LocalVolumes;

    static TransportRules FromConfig();
};

// Decides whether a path lives on fast local storage or on a constrained
// network share. Pure: no filesystem access.
class TransportClassifier
{
public:
    explicit TransportClassifier(TransportRules Rules);

    TransportClass Classify(const std::string& Path) const;

    // Most network-like class across all roots. An empty batch is Local.
    TransportClass ClassifyBatch(const std::vector<std::string>& Paths) const;

    const TransportRules& GetRules() const;

private:
    TransportRules Rules;

    bool HasProtocolPrefix(const std::string& LowerPath) const;
    bool IsUncPath(const std::string& Path) const;
    bool IsUnderNetworkRoot(const std::string& Path) const;
    bool IsKnownLocalVolume(const std::string& VolumeName) const;
};
