#ifndef INCLUDE_CREDHASH_CORE_CONFIGSOURCE_HPP
#define INCLUDE_CREDHASH_CORE_CONFIGSOURCE_HPP

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace credhash::core
{

// Read-only view of process-wide configuration. Implementations must tolerate
// concurrent value() calls; the parameter store queries on every encode.
class ConfigSource
{
public:
    ConfigSource() = default;
    ConfigSource(const ConfigSource&) = delete;
    ConfigSource& operator=(const ConfigSource&) = delete;
    ConfigSource(ConfigSource&&) = delete;
    ConfigSource& operator=(ConfigSource&&) = delete;
    virtual ~ConfigSource() = default;

    [[nodiscard]] virtual std::optional<std::string> value(std::string_view name) const = 0;
};

// Process environment, read at call time so an operator change applies to the next call.
class EnvConfigSource final : public ConfigSource
{
public:
    EnvConfigSource() = default;
    explicit EnvConfigSource(std::string prefix) : m_prefix{ std::move(prefix) }
    {
    }

    [[nodiscard]] std::optional<std::string> value(std::string_view name) const override;

private:
    std::string m_prefix;
};

// In-memory values a host can swap at runtime.
class MapConfigSource final : public ConfigSource
{
public:
    MapConfigSource() = default;
    explicit MapConfigSource(std::map<std::string, std::string, std::less<>> values);

    [[nodiscard]] std::optional<std::string> value(std::string_view name) const override;

    void set(std::string name, std::string value);
    void erase(std::string_view name);

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::string, std::less<>> m_values;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_CONFIGSOURCE_HPP
