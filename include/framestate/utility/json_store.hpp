// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace framestate {
namespace utility {

    /* Class JsonStore
    Thin wrapper around nlohmann::json that addresses nested values with
    json pointer style paths, e.g. "/framestate/log/level". */
    class JsonStore : public nlohmann::json {
      public:
        JsonStore() : nlohmann::json(nlohmann::json::object()) {}
        JsonStore(const nlohmann::json &j) : nlohmann::json(j) {}
        JsonStore(const JsonStore &o) = default;
        JsonStore &operator=(const JsonStore &o) = default;

        [[nodiscard]] bool has(const std::string &path) const;

        // throws nlohmann::json::exception if path does not exist
        [[nodiscard]] nlohmann::json get(const std::string &path) const;

        template <typename T> [[nodiscard]] T get(const std::string &path) const {
            return get(path).template get<T>();
        }

        void set(const nlohmann::json &value, const std::string &path);

        [[nodiscard]] const nlohmann::json &cref() const { return *this; }
    };

} // namespace utility
} // namespace framestate
