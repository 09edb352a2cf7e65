#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sproc_mapper::invoke {

// Connection configuration could not be read
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Named connection descriptors
 *
 * Entries come from a JSON document of the form
 *   { "connections": { "main": "DSN=Main;UID=app;PWD=secret" } }
 * and from environment variables SPROC_MAPPER_CONNECTION_<NAME>
 * (name upper-cased). Explicit entries take precedence over the environment.
 */
class ConnectionCatalog {
public:
    // Throws ConfigError on unreadable files or malformed documents
    static ConnectionCatalog load_file(const std::string& path);
    static ConnectionCatalog from_json_text(std::string_view text);

    void add(const std::string& name, const std::string& connection_string);

    // Case-insensitive name lookup, then the environment
    std::optional<std::string> find(const std::string& name) const;

    // Catalog entry for a name, or the argument itself when it already is a
    // connection string. Throws core::ConnectionError for unknown names.
    std::string resolve(const std::string& name_or_connection) const;

    std::vector<std::string> names() const;
    bool empty() const noexcept { return entries_.empty(); }

    static std::string environment_variable(const std::string& name);

private:
    std::map<std::string, std::string> entries_;   // lower-cased name -> connection string
};

} // namespace sproc_mapper::invoke
