#include "TransportClassifier.hpp"
#include "ConfigGlobal.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace
{
    const std::array<const char*, 7> NetworkProtocolPrefixes = {
        "smb://", "nfs://", "afp://", "cifs://", "ftp://", "sftp://", "webdav://"
    };

    std::string ToLower(std::string Value)
    {
        std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Value;
    }

    std::string WithTrailingSlash(const std::string& Root)
    {
        if (!Root.empty() && Root.back() != '/')
        {
            return Root + "/";
        }
        return Root;
    }
}

std::string TransportToString(TransportClass Transport)
{
    return Transport == TransportClass::Network ? "network" : "local";
}

TransportRules TransportRules::FromConfig()
{
    TransportRules Rules;
    Rules.NetworkRoots = ConfigGlobal::NetworkRoots;
    Rules.LocalVolumes = ConfigGlobal::LocalVolumes;
    return Rules;
}

TransportClassifier::TransportClassifier(TransportRules Rules) : Rules(std::move(Rules))
{
}

const TransportRules& TransportClassifier::GetRules() const
{
    return Rules;
}

TransportClass TransportClassifier::Classify(const std::string& Path) const
{
    const std::string LowerPath = ToLower(Path);

    if (HasProtocolPrefix(LowerPath) || IsUncPath(Path))
    {
        return TransportClass::Network;
    }

    // GVFS mounts smb/sftp shares under /run/user/<uid>/gvfs/
    if (LowerPath.starts_with("/run/user/") && LowerPath.find("/gvfs/") != std::string::npos)
    {
        return TransportClass::Network;
    }

    if (IsUnderNetworkRoot(Path))
    {
        return TransportClass::Network;
    }

    return TransportClass::Local;
}

TransportClass TransportClassifier::ClassifyBatch(const std::vector<std::string>& Paths) const
{
    for (const auto& Path : Paths)
    {
        if (Classify(Path) == TransportClass::Network)
        {
            return TransportClass::Network;
        }
    }
    return TransportClass::Local;
}

bool TransportClassifier::HasProtocolPrefix(const std::string& LowerPath) const
{
    for (const char* Prefix : NetworkProtocolPrefixes)
    {
        if (LowerPath.starts_with(Prefix))
        {
            return true;
        }
    }
    return false;
}

bool TransportClassifier::IsUncPath(const std::string& Path) const
{
    return Path.starts_with("//") || Path.starts_with("\\\\");
}

bool TransportClassifier::IsUnderNetworkRoot(const std::string& Path) const
{
    for (const auto& Root : Rules.NetworkRoots)
    {
        if (Root.empty())
        {
            continue;
        }

        const std::string Prefix = WithTrailingSlash(Root);
        if (!Path.starts_with(Prefix))
        {
            continue;
        }

        // First component under the mount root names the volume
        std::string Remainder = Path.substr(Prefix.size());
        std::string VolumeName = Remainder.substr(0, Remainder.find('/'));

        if (IsKnownLocalVolume(VolumeName))
        {
            return false;
        }
        return true;
    }
    return false;
}

bool TransportClassifier::IsKnownLocalVolume(const std::string& VolumeName) const
{
    if (VolumeName.empty())
    {
        return false;
    }

    const std::string LowerVolume = ToLower(VolumeName);
    for (const auto& Pattern : Rules.LocalVolumes)
    {
        if (!Pattern.empty() && LowerVolume.find(ToLower(Pattern)) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}
