#include "credhash/core/ConfigSource.hpp"

#include <cstdlib>
#include <mutex>
#include <utility>

namespace credhash::core
{

std::optional<std::string> EnvConfigSource::value(std::string_view name) const
{
    if (name.empty())
    {
        return std::nullopt;
    }

    std::string key{ m_prefix };
    key += name;

#if defined(_WIN32)
    char* raw{ nullptr };
    std::size_t len{ 0U };
    if (_dupenv_s(&raw, &len, key.c_str()) != 0 || raw == nullptr)
    {
        return std::nullopt;
    }
    std::string out{ raw };
    std::free(raw);
    return out;
#else
    // getenv is safe against concurrent getenv; the host must not setenv while calls are in flight.
    const char* raw{ std::getenv(key.c_str()) };
    if (raw == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ raw };
#endif
}

MapConfigSource::MapConfigSource(std::map<std::string, std::string, std::less<>> values) : m_values{ std::move(values) }
{
}

std::optional<std::string> MapConfigSource::value(std::string_view name) const
{
    std::shared_lock lock{ m_mutex };
    if (const auto it{ m_values.find(name) }; it != m_values.end())
    {
        return it->second;
    }
    return std::nullopt;
}

void MapConfigSource::set(std::string name, std::string value)
{
    std::unique_lock lock{ m_mutex };
    m_values.insert_or_assign(std::move(name), std::move(value));
}

void MapConfigSource::erase(std::string_view name)
{
    std::unique_lock lock{ m_mutex };
    if (const auto it{ m_values.find(name) }; it != m_values.end())
    {
        m_values.erase(it);
    }
}

} // namespace credhash::core
