// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <functional>
#include <limits>
#include <mutex>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "framestate/primitive/frame_visibility_engine.hpp"
#include "framestate/utility/error.hpp"
#include "framestate/utility/preferences.hpp"

using namespace framestate;
using namespace framestate::primitive;


namespace {

template <class> inline constexpr bool always_false_v = false;

constexpr size_t npos = std::numeric_limits<size_t>::max();

StateRecord make_record(
    const RecordId id, const FrameAssociation &association, const StateDescriptor &state) {
    StateRecord r;
    r.id          = id;
    r.association = association;
    r.state       = state;
    return r;
}

} // anonymous namespace

EngineOptions EngineOptions::from_preferences(const utility::JsonStore &prefs) {

    EngineOptions opts;
    try {
        opts.verify_invariants = utility::preference_value<bool>(
            prefs, "/framestate/engine/verify_invariants", opts.verify_invariants);
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
    }
    return opts;
}

FrameVisibilityEngine::FrameVisibilityEngine(
    dataset::FrameIndexSourcePtr frames, const EngineOptions &options)
    : frames_(std::move(frames)), options_(options) {
    changed();
}

FrameVisibilityEngine::FrameVisibilityEngine(
    const StateDescriptor &initial_state,
    dataset::FrameIndexSourcePtr frames,
    const EngineOptions &options)
    : frames_(std::move(frames)), options_(options) {

    records_.push_back(
        make_record(next_record_id_++, FrameAssociation::ubiquitous(), initial_state));
    changed();
}

FrameVisibilityEngine::FrameVisibilityEngine(const FrameVisibilityEngine &o) {

    std::shared_lock l(o.mutex_);
    records_          = o.records_;
    next_record_id_   = o.next_record_id_;
    frames_           = o.frames_;
    options_          = o.options_;
    hash_             = o.hash_;
    last_change_time_ = o.last_change_time_;
}

FrameVisibilityEngine &FrameVisibilityEngine::operator=(const FrameVisibilityEngine &o) {

    if (this == &o)
        return *this;

    std::unique_lock l(mutex_, std::defer_lock);
    std::shared_lock ol(o.mutex_, std::defer_lock);
    std::lock(l, ol);

    records_          = o.records_;
    next_record_id_   = o.next_record_id_;
    frames_           = o.frames_;
    options_          = o.options_;
    hash_             = o.hash_;
    last_change_time_ = o.last_change_time_;
    return *this;
}

bool FrameVisibilityEngine::operator==(const FrameVisibilityEngine &o) const {

    if (this == &o)
        return true;

    std::shared_lock l(mutex_, std::defer_lock);
    std::shared_lock ol(o.mutex_, std::defer_lock);
    std::lock(l, ol);
    return records_ == o.records_;
}

std::optional<StateRecord> FrameVisibilityEngine::active_record(const int frame) const {

    if (frame < 0)
        throw utility::FrameStateError(
            utility::framestate_error::malformed_association,
            fmt::format("cannot resolve a state for negative frame {}", frame));

    std::shared_lock l(mutex_);

    const StateRecord *result = nullptr;
    size_t candidates         = 0;
    for (const auto &r : records_) {
        if (r.visible_in(frame)) {
            if (!result)
                result = &r;
            candidates++;
            if (!options_.verify_invariants)
                break;
        }
    }

    if (candidates > 1) {
        spdlog::critical(
            "{} {} records are visible in frame {}", __PRETTY_FUNCTION__, candidates, frame);
        throw utility::FrameStateError(
            utility::framestate_error::inconsistent_state,
            fmt::format("{} records are visible in frame {}", candidates, frame));
    }

    if (result)
        return *result;
    return {};
}

bool FrameVisibilityEngine::has_state_for_frame(const int frame) const {
    return active_record(frame).has_value();
}

std::optional<StateRecord> FrameVisibilityEngine::find(const RecordId id) const {

    std::shared_lock l(mutex_);
    const auto idx = index_of(id);
    if (idx == npos)
        return {};
    return records_[idx];
}

bool FrameVisibilityEngine::contains(const RecordId id) const {
    std::shared_lock l(mutex_);
    return index_of(id) != npos;
}

FrameVisibilityEngine::RecordVec FrameVisibilityEngine::records() const {
    std::shared_lock l(mutex_);
    return records_;
}

size_t FrameVisibilityEngine::size() const {
    std::shared_lock l(mutex_);
    return records_.size();
}

bool FrameVisibilityEngine::empty() const {
    std::shared_lock l(mutex_);
    return records_.empty();
}

std::vector<int> FrameVisibilityEngine::visible_frames() const {

    std::shared_lock l(mutex_);
    std::vector<int> result;
    for (const auto frame : valid_frames()) {
        if (std::any_of(records_.begin(), records_.end(), [frame](const StateRecord &r) {
                return r.visible_in(frame);
            }))
            result.push_back(frame);
    }
    return result;
}

std::vector<RecordId> FrameVisibilityEngine::orphaned_records() const {
    std::shared_lock l(mutex_);
    return orphaned_records_no_lock();
}

std::vector<RecordId> FrameVisibilityEngine::orphaned_records_no_lock() const {

    std::vector<RecordId> result;
    if (!frames_)
        return result;

    for (const auto &r : records_) {
        const auto frame = r.association.frame();
        if (frame && !frames_->contains(*frame))
            result.push_back(r.id);
    }
    return result;
}

bool FrameVisibilityEngine::check_invariants() const {
    std::shared_lock l(mutex_);
    return check_invariants(records_);
}

bool FrameVisibilityEngine::check_invariants(const RecordVec &records, std::string *reason) {

    auto fail = [reason](const std::string &why) {
        if (reason)
            *reason = why;
        return false;
    };

    std::set<RecordId> ids;
    std::set<int> single_frames;
    size_t ubiquitous = 0;
    size_t avoiding   = 0;
    int avoided_frame = -1;

    for (const auto &r : records) {
        if (!ids.insert(r.id).second)
            return fail(fmt::format("record id {} is used twice", r.id));

        switch (r.association.kind()) {
        case AssociationKind::Ubiquitous:
            ubiquitous++;
            break;
        case AssociationKind::FrameAvoiding:
            avoiding++;
            avoided_frame = *r.association.frame();
            break;
        case AssociationKind::SingleFrame:
            if (!single_frames.insert(*r.association.frame()).second)
                return fail(fmt::format(
                    "frame {} is held by more than one single frame record",
                    *r.association.frame()));
            break;
        }
    }

    if (ubiquitous && records.size() != 1)
        return fail(fmt::format(
            "a ubiquitous record shares the sequence with {} other record(s)",
            records.size() - 1));

    if (avoiding > 1)
        return fail(fmt::format("{} frame avoiding records", avoiding));

    if (avoiding == 1 && (records.size() > 2 ||
                          (records.size() == 2 && !single_frames.count(avoided_frame))))
        return fail(fmt::format(
            "FrameAvoiding({}) is accompanied by records other than SingleFrame({})",
            avoided_frame,
            avoided_frame));

    // I1 follows from the above: a ubiquitous record is alone, an avoiding
    // record only meets the single frame record filling its gap and single
    // frame records never share a frame.
    return true;
}

RecordId FrameVisibilityEngine::add_state(
    const StateDescriptor &state, const FrameAssociation &association) {

    std::unique_lock l(mutex_);

    RecordId next_id  = next_record_id_;
    const RecordId id = next_id++;

    RecordVec records = records_;
    records.push_back(make_record(id, association, state));

    auto result = relink(records, records.size() - 1, association, next_id);
    commit(std::move(result), next_id);

    spdlog::debug(
        "Added state record {} as {}, {} record(s) held",
        id,
        association.to_string(),
        records_.size());
    return id;
}

void FrameVisibilityEngine::reassign(const RecordId target, const FrameAssociation &association) {

    std::unique_lock l(mutex_);

    const auto idx = index_of(target);
    if (idx == npos)
        throw utility::FrameStateError(
            utility::framestate_error::invalid_target,
            fmt::format("record {} is not held by this primitive", target));

    const auto previous = records_[idx].association;
    RecordId next_id    = next_record_id_;

    auto result = relink(records_, idx, association, next_id);
    commit(std::move(result), next_id);

    spdlog::debug(
        "Reassigned state record {} from {} to {}, {} record(s) held",
        target,
        previous.to_string(),
        association.to_string(),
        records_.size());
}

void FrameVisibilityEngine::reassign_encoded(
    const RecordId target, const std::optional<int> &encoded) {
    reassign(target, FrameAssociation::from_encoded(encoded));
}

void FrameVisibilityEngine::set_state(const RecordId target, const StateDescriptor &state) {

    std::unique_lock l(mutex_);

    const auto idx = index_of(target);
    if (idx == npos)
        throw utility::FrameStateError(
            utility::framestate_error::invalid_target,
            fmt::format("record {} is not held by this primitive", target));

    records_[idx].state = state;
    changed();
}

void FrameVisibilityEngine::set_frame_source(dataset::FrameIndexSourcePtr frames) {
    std::unique_lock l(mutex_);
    frames_ = std::move(frames);
    changed();
}

dataset::FrameIndexSourcePtr FrameVisibilityEngine::frame_source() const {
    std::shared_lock l(mutex_);
    return frames_;
}

std::vector<RecordId> FrameVisibilityEngine::dataset_changed() {

    std::unique_lock l(mutex_);

    const auto orphans = orphaned_records_no_lock();
    for (const auto id : orphans) {
        const auto &r = records_[index_of(id)];
        spdlog::warn(
            "State record {} ({}) refers to a frame missing from the dataset",
            id,
            r.association.to_string());
    }

    changed();
    return orphans;
}

FrameVisibilityEngine::RecordVec FrameVisibilityEngine::relink(
    const RecordVec &records,
    const size_t target_idx,
    const FrameAssociation &association,
    RecordId &next_id) const {

    RecordVec result;
    result.reserve(records.size());

    StateRecord target = records[target_idx];
    target.association = association;

    if (association.is_ubiquitous()) {
        result.push_back(target);
        return result;
    }

    if (const auto *avoid = std::get_if<FrameAvoiding>(&association.rule())) {
        // only a record filling the avoided frame may stay
        const auto gap = FrameAssociation::single_frame(avoid->frame);
        for (size_t i = 0; i < records.size(); ++i) {
            if (i == target_idx)
                result.push_back(target);
            else if (records[i].association == gap)
                result.push_back(records[i]);
        }
        return result;
    }

    const int frame = std::get<SingleFrame>(association.rule()).frame;

    // frames held after the reassignment by single frame records, an
    // expanded avoiding record must not claim them
    std::set<int> occupied{frame};
    for (size_t i = 0; i < records.size(); ++i) {
        if (i != target_idx && records[i].association.is_single_frame())
            occupied.insert(*records[i].association.frame());
    }

    for (size_t i = 0; i < records.size(); ++i) {

        if (i == target_idx) {
            result.push_back(target);
            continue;
        }

        const auto &r = records[i];
        std::visit(
            [&](auto &&arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, SingleFrame>) {
                    // last writer takes the slot
                    if (arg.frame != frame)
                        result.push_back(r);
                } else if constexpr (std::is_same_v<T, FrameAvoiding>) {
                    if (arg.frame == frame) {
                        // target fills the gap this record leaves
                        result.push_back(r);
                        return;
                    }

                    // 'frame' is visible under this record and 'arg.frame'
                    // must stay hidden: one excluded frame is no longer
                    // enough, enumerate what is left.
                    const auto frames = valid_frames();
                    if (frames.empty()) {
                        spdlog::warn(
                            "{} no dataset frames available to expand state record {} ({}), "
                            "discarding it",
                            __PRETTY_FUNCTION__,
                            r.id,
                            r.association.to_string());
                        return;
                    }

                    size_t materialised = 0;
                    for (const auto f : frames) {
                        if (f == arg.frame || occupied.count(f))
                            continue;
                        result.push_back(
                            make_record(next_id++, FrameAssociation::single_frame(f), r.state));
                        occupied.insert(f);
                        materialised++;
                    }

                    spdlog::debug(
                        "Expanded state record {} ({}) into {} single frame record(s)",
                        r.id,
                        r.association.to_string(),
                        materialised);
                } else if constexpr (std::is_same_v<T, Ubiquitous>) {
                    // narrowed so that it keeps every frame but the claimed one
                    StateRecord narrowed = r;
                    narrowed.association = FrameAssociation::frame_avoiding(frame);
                    result.push_back(narrowed);
                } else
                    static_assert(always_false_v<T>, "Missing relink rule for association!");
            },
            r.association.rule());
    }

    return result;
}

std::vector<int> FrameVisibilityEngine::valid_frames() const {

    if (!frames_)
        return {};

    auto frames = frames_->valid_frame_indices();
    frames.erase(
        std::remove_if(frames.begin(), frames.end(), [](const int f) { return f < 0; }),
        frames.end());
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    return frames;
}

size_t FrameVisibilityEngine::index_of(const RecordId id) const {
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].id == id)
            return i;
    }
    return npos;
}

void FrameVisibilityEngine::commit(RecordVec &&records, const RecordId next_id) {

    if (options_.verify_invariants) {
        std::string reason;
        if (!check_invariants(records, &reason)) {
            spdlog::critical("{} {}", __PRETTY_FUNCTION__, reason);
            throw utility::FrameStateError(utility::framestate_error::inconsistent_state, reason);
        }
    }

    records_.swap(records);
    next_record_id_ = next_id;
    changed();
}

void FrameVisibilityEngine::changed() {

    last_change_time_ = clock::now();
    std::ostringstream oss;
    oss << last_change_time_.time_since_epoch().count() << (void *)this;
    hash_ = std::hash<std::string>{}(oss.str());
}

void framestate::primitive::to_json(nlohmann::json &j, const FrameVisibilityEngine &e) {

    std::shared_lock l(e.mutex_);
    j["records"] = nlohmann::json::array();
    for (const auto &r : e.records_) {
        j["records"].push_back(nlohmann::json(r));
    }
}
