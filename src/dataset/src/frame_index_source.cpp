// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <numeric>

#include <fmt/format.h>

#include "framestate/dataset/frame_index_source.hpp"
#include "framestate/utility/error.hpp"

using namespace framestate;
using namespace framestate::dataset;

namespace {

void check_frame_index(const int frame) {
    if (frame < 0)
        throw utility::FrameStateError(
            utility::framestate_error::malformed_association,
            fmt::format("frame index must be non-negative, got {}", frame));
}

} // anonymous namespace

bool FrameIndexSource::contains(const int frame) const {
    const auto frames = valid_frame_indices();
    return std::binary_search(frames.begin(), frames.end(), frame);
}

FrameRange::FrameRange(const int count) { set_frame_count(count); }

std::vector<int> FrameRange::valid_frame_indices() const {
    std::vector<int> result(static_cast<size_t>(count_));
    std::iota(result.begin(), result.end(), 0);
    return result;
}

bool FrameRange::contains(const int frame) const { return frame >= 0 && frame < count_; }

void FrameRange::set_frame_count(const int count) {
    if (count < 0)
        throw utility::FrameStateError(
            utility::framestate_error::malformed_association,
            fmt::format("frame count must be non-negative, got {}", count));
    count_ = count;
}

FrameIndexSet::FrameIndexSet(const std::vector<int> &frames) {
    for (const auto f : frames) {
        check_frame_index(f);
    }
    frames_.insert(frames.begin(), frames.end());
}

std::vector<int> FrameIndexSet::valid_frame_indices() const {
    return std::vector<int>(frames_.begin(), frames_.end());
}

bool FrameIndexSet::contains(const int frame) const { return frames_.count(frame) != 0; }

bool FrameIndexSet::add_frame(const int frame) {
    check_frame_index(frame);
    return frames_.insert(frame).second;
}

bool FrameIndexSet::remove_frame(const int frame) { return frames_.erase(frame) != 0; }
