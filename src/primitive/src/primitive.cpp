// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "framestate/primitive/primitive.hpp"
#include "framestate/utility/error.hpp"

using namespace framestate;
using namespace framestate::primitive;

Primitive::Primitive(
    const PrimitiveType type,
    const std::string &name,
    dataset::FrameIndexSourcePtr frames,
    const EngineOptions &options)
    : type_(type), name_(name), engine_(std::move(frames), options) {}

Primitive::Primitive(
    const PrimitiveType type,
    const std::string &name,
    const StateDescriptor &initial_state,
    dataset::FrameIndexSourcePtr frames,
    const EngineOptions &options)
    : type_(type), name_(name), engine_(initial_state, std::move(frames), options) {}

bool Primitive::set_current_frame(const int frame) {

    if (frame < 0)
        throw utility::FrameStateError(
            utility::framestate_error::malformed_association,
            fmt::format("{} cannot move to negative frame {}", name_, frame));

    current_frame_ = frame;
    return visible();
}

std::optional<StateRecord> Primitive::current_record() const {
    return engine_.active_record(current_frame_);
}

bool Primitive::visible() const { return engine_.has_state_for_frame(current_frame_); }

void Primitive::set_frame_visibility(const std::vector<int> &frames) {

    // validate everything before touching the records
    std::vector<FrameAssociation> associations;
    associations.reserve(frames.size());
    for (const auto f : frames) {
        associations.push_back(FrameAssociation::single_frame(f));
    }

    if (engine_.empty()) {
        spdlog::warn("{} {} has no state to link to frames", __PRETTY_FUNCTION__, name_);
        return;
    }

    StateRecord governing;
    if (auto current = engine_.active_record(current_frame_)) {
        governing = *current;
    } else {
        governing = engine_.records().front();
    }

    // collapse onto one record first, the rest is created from it
    engine_.reassign(governing.id, FrameAssociation::ubiquitous());
    if (associations.empty())
        return;

    std::sort(associations.begin(), associations.end(), [](const auto &a, const auto &b) {
        return *a.frame() < *b.frame();
    });
    associations.erase(std::unique(associations.begin(), associations.end()), associations.end());

    engine_.reassign(governing.id, associations.front());
    for (auto a = associations.begin() + 1; a != associations.end(); ++a) {
        engine_.add_state(governing.state, *a);
    }
}

std::vector<int> Primitive::frame_visibility() const {

    const auto records = engine_.records();
    std::vector<int> result;
    for (const auto &r : records) {
        if (r.association.is_ubiquitous())
            return {};
        // an avoiding record covers open ended frames, list them explicitly
        if (r.association.is_frame_avoiding())
            return engine_.visible_frames();
        result.push_back(*r.association.frame());
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<RecordId> Primitive::frames_changed() {

    auto orphans = engine_.dataset_changed();
    const auto frames = engine_.frame_source();
    if (frames && !frames->contains(current_frame_))
        spdlog::debug("{} current frame {} is no longer part of the dataset", name_, current_frame_);
    return orphans;
}

void framestate::primitive::to_json(nlohmann::json &j, const Primitive &p) {

    j = nlohmann::json(p.engine());
    j["name"]          = p.name();
    j["type"]          = std::string(PrimitiveType_to_str(p.type()));
    j["current_frame"] = p.current_frame();
}
