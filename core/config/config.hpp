/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_DATASPACE_CORE_CONFIG_CONFIG_HPP
#define CPP_DATASPACE_CORE_CONFIG_CONFIG_HPP

#include <boost/property_tree/ptree.hpp>
#include <string>

#include "common/outcome.hpp"
#include "config/config_error.hpp"

namespace ds::config {

  /** @brief Configuration key, dot separated path */
  using ConfigKey = std::string;

  /**
   * @brief Participant configuration tree
   */
  class Config {
   public:
    virtual ~Config() = default;

    /**
     * @brief Save config to file
     * @param filename - path to a file to store config
     * @return nothing or error occurred
     */
    outcome::result<void> save(const std::string &filename) const;

    /**
     * @brief Load config from file
     * @param filename - path to a file with config
     * @return nothing or error occurred
     */
    outcome::result<void> load(const std::string &filename);

    /**
     * Set config value
     * @tparam T - parameter of a configuration value
     * @param key - configuration key
     * @param value - configuration value
     * @return - nothing or error occurred
     */
    template <typename T>
    outcome::result<void> set(const ConfigKey &key, const T &value) {
      ptree_.put<T>(key, value);
      return outcome::success();
    }

    /**
     * Get config value by key
     * @tparam T - expected parameter of a configuration value
     * @param key - configuration key
     * @return value or error occurred
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key) const {
      try {
        return ptree_.get<T>(key);
      } catch (const boost::property_tree::ptree_bad_path &) {
        return ConfigError::kBadPath;
      } catch (const boost::property_tree::ptree_bad_data &) {
        return ConfigError::kBadValue;
      }
    }

    /**
     * Get config value by key, fall back to default if the key is absent
     * @return value, default value or kBadValue if the stored value cannot be
     * converted to T
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key, const T &default_value) const {
      if (!ptree_.get_child_optional(key)) {
        return default_value;
      }
      return get<T>(key);
    }

   private:
    boost::property_tree::ptree ptree_;
  };

}  // namespace ds::config

#endif  // CPP_DATASPACE_CORE_CONFIG_CONFIG_HPP
