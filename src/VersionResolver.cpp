#include "VersionResolver.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>

namespace
{
    // crate names match case-insensitively and treat '-' and '_' alike
    std::string canonicalize(const std::string &name)
    {
        std::string result = name;
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                       { return c == '-' ? '_' : static_cast<char>(std::tolower(c)); });
        return result;
    }
}

void InMemoryVersionResolver::addVersion(const std::string &name, const std::string &version, const std::string &key)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_versions[{canonicalize(name), version}] = ResolvedVersion{key, name};
}

std::optional<ResolvedVersion> InMemoryVersionResolver::resolve(const std::string &name,
                                                                const std::string &version) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_versions.find({canonicalize(name), version});
    if (it == m_versions.end())
    {
        return std::nullopt;
    }
    return it->second;
}
