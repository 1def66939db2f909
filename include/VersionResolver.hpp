#ifndef VERSION_RESOLVER_HPP
#define VERSION_RESOLVER_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>

struct ResolvedVersion
{
    std::string key;       // counter key for this version
    std::string crateName; // canonical name as stored
};

// Maps a human-facing (name, version) to the counter key
class VersionResolver
{
public:
    virtual ~VersionResolver() = default;
    virtual std::optional<ResolvedVersion> resolve(const std::string &name,
                                                   const std::string &version) const = 0;
};

class VersionNotFound : public std::runtime_error
{
public:
    VersionNotFound(const std::string &name, const std::string &version)
        : std::runtime_error("crate `" + name + "` does not have a version `" + version + "`"),
          m_name(name), m_version(version) {}

    const std::string &name() const { return m_name; }
    const std::string &version() const { return m_version; }

private:
    std::string m_name;
    std::string m_version;
};

class InMemoryVersionResolver : public VersionResolver
{
public:
    void addVersion(const std::string &name, const std::string &version, const std::string &key);
    std::optional<ResolvedVersion> resolve(const std::string &name,
                                           const std::string &version) const override;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::pair<std::string, std::string>, ResolvedVersion> m_versions;
};

#endif
