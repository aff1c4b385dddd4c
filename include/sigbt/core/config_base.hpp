// include/sigbt/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "sigbt/core/error.hpp"

namespace sigbt {

/**
 * @brief JSON-backed configuration
 *
 * Subclasses only map their fields in to_json()/from_json(). from_json()
 * treats every key as optional and keeps the current value for a missing
 * one, so partial run files overlay the defaults.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Apply a JSON document, reporting type errors instead of throwing
     * @return JSON_PARSE_ERROR if a field has the wrong JSON type
     */
    Result<void> load_from_json(const nlohmann::json& j);

    /**
     * @brief Write the configuration as indented JSON
     * @return FILE_IO_ERROR if the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read and apply a JSON file
     * @return FILE_NOT_FOUND if it cannot be opened, JSON_PARSE_ERROR for
     *         malformed JSON or mistyped fields
     */
    virtual Result<void> load_from_file(const std::string& filepath);
};

}  // namespace sigbt
