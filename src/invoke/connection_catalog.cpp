#include "connection_catalog.hpp"
#include "core/connection_string.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "core/string_utils.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sproc_mapper::invoke {

ConnectionCatalog ConnectionCatalog::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open connection configuration: " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();

    LOG_DEBUG("Loading connections from " + path);
    return from_json_text(content.str());
}

ConnectionCatalog ConnectionCatalog::from_json_text(std::string_view text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed connection configuration: ") + e.what());
    }

    if (!document.is_object() || !document.contains("connections")) {
        throw ConfigError("Connection configuration needs a \"connections\" object");
    }

    const auto& connections = document["connections"];
    if (!connections.is_object()) {
        throw ConfigError("\"connections\" must be an object of name -> connection string");
    }

    ConnectionCatalog catalog;
    for (auto it = connections.begin(); it != connections.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigError("Connection \"" + it.key() + "\" must be a string");
        }
        catalog.add(it.key(), it.value().get<std::string>());
    }
    return catalog;
}

void ConnectionCatalog::add(const std::string& name, const std::string& connection_string) {
    entries_[core::to_lower(name)] = connection_string;
}

std::optional<std::string> ConnectionCatalog::find(const std::string& name) const {
    auto it = entries_.find(core::to_lower(name));
    if (it != entries_.end()) {
        return it->second;
    }

    if (const char* env = std::getenv(environment_variable(name).c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConnectionCatalog::resolve(const std::string& name_or_connection) const {
    if (auto found = find(name_or_connection)) {
        LOG_DEBUG("Connection '" + name_or_connection + "' resolved: " +
                  core::redact_connection_string(*found));
        return *found;
    }

    if (core::looks_like_connection_string(name_or_connection)) {
        return name_or_connection;
    }

    throw core::ConnectionError("Unknown connection name: " + name_or_connection);
}

std::vector<std::string> ConnectionCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

std::string ConnectionCatalog::environment_variable(const std::string& name) {
    std::string variable = "SPROC_MAPPER_CONNECTION_";
    for (unsigned char c : name) {
        variable += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    }
    return variable;
}

} // namespace sproc_mapper::invoke
