// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

#include "framestate/primitive/frame_association.hpp"
#include "framestate/primitive/state_descriptor.hpp"

namespace framestate {
namespace primitive {

    typedef uint32_t RecordId;

    struct StateRecord {

        bool operator==(const StateRecord &o) const {
            return id == o.id && association == o.association && state == o.state;
        }
        bool operator!=(const StateRecord &o) const { return !(*this == o); }

        [[nodiscard]] bool visible_in(const int frame) const {
            return association.visible_in(frame);
        }

        RecordId id{0};
        FrameAssociation association;
        StateDescriptor state;
    };

    void to_json(nlohmann::json &j, const StateRecord &r);

} // namespace primitive
} // namespace framestate
