// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace resolute {

using json = nlohmann::json;

/**
 * @brief Application configuration
 *
 * Loads and manages the JSON configuration file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access. Constructed explicitly at process entry
 * and handed to the components that need it; there is no global instance.
 *
 * Thread safety: Not thread-safe. Initialize once at startup and access from
 * the main loop thread only.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init(paths.config_file());
 *
 * // Get with default fallback
 * int delay = cfg.get<int>("/lifecycle/close_reshow_delay_ms", 2000);
 *
 * // Set and save
 * cfg.set<bool>("/supervisor/enabled", false);
 * cfg.save();
 * ```
 */
class Config {
  protected:
    json data;
    std::string path;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file and fills in any missing keys from the defaults.
     * A missing or unparseable file is replaced by the defaults and written
     * back so the user has something to edit.
     *
     * @param config_path Absolute path to JSON configuration file
     * @return true if the file was loaded, false if defaults were used
     */
    bool init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) const {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    }

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of the
     * wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data.at(ptr).template get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

    /**
     * @brief Integer setting limited to [min_value, max_value]
     *
     * Missing or non-numeric values give default_value. Values outside the
     * range (negative numbers included) are clamped with a warning.
     */
    int64_t get_in_range(const std::string& json_ptr, int64_t default_value, int64_t min_value,
                         int64_t max_value) const;

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. Changes are in-memory
     * only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    }

    /**
     * @brief Get JSON sub-object at path (created if missing)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return true on success
     */
    bool save() const;

    const std::string& get_path() const {
        return path;
    }

    /**
     * @brief Default configuration document
     */
    static json default_config();
};

} // namespace resolute
