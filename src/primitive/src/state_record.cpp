// SPDX-License-Identifier: Apache-2.0

#include "framestate/primitive/state_record.hpp"

using namespace framestate::primitive;

void framestate::primitive::to_json(nlohmann::json &j, const StateRecord &r) {
    j = nlohmann::json{{"id", r.id}, {"association", r.association}, {"state", r.state}};
}
