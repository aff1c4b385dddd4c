// src/core/config_base.cpp
#include "sigbt/core/config_base.hpp"
#include <fstream>

namespace sigbt {

namespace {
constexpr const char* kComponent = "ConfigBase";
}

Result<void> ConfigBase::load_from_json(const nlohmann::json& j) {
    try {
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Invalid configuration field: ") + e.what(),
                                kComponent);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                std::string("Error applying configuration: ") + e.what(),
                                kComponent);
    }
    return Result<void>();
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::string text;
    try {
        text = to_json().dump(4);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Cannot serialise configuration: ") + e.what(),
                                kComponent);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot open " + filepath + " for writing",
                                kComponent);
    }
    file << text << '\n';
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + filepath,
                                kComponent);
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Cannot open " + filepath,
                                kComponent);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Malformed JSON in " + filepath + ": " + e.what(), kComponent);
    }
    return load_from_json(j);
}

}  // namespace sigbt
