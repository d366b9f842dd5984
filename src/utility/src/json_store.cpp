// SPDX-License-Identifier: Apache-2.0

#include "framestate/utility/json_store.hpp"

using namespace framestate::utility;

bool JsonStore::has(const std::string &path) const {
    if (path.empty())
        return true;
    return contains(nlohmann::json::json_pointer(path));
}

nlohmann::json JsonStore::get(const std::string &path) const {
    if (path.empty())
        return cref();
    return at(nlohmann::json::json_pointer(path));
}

void JsonStore::set(const nlohmann::json &value, const std::string &path) {
    if (path.empty()) {
        nlohmann::json::operator=(value);
    } else {
        (*this)[nlohmann::json::json_pointer(path)] = value;
    }
}
