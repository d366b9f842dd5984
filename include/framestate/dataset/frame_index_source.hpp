// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <set>
#include <vector>

namespace framestate {
namespace dataset {

    /* Class FrameIndexSource
    Capability handed to a primitive by the dataset it is overlaid on. The
    primitive only asks for the valid frame indices when it has to enumerate
    the frames covered by a frame-avoiding state. */
    class FrameIndexSource {
      public:
        virtual ~FrameIndexSource() = default;

        // ascending, unique, non-negative
        [[nodiscard]] virtual std::vector<int> valid_frame_indices() const = 0;

        [[nodiscard]] virtual bool contains(const int frame) const;

        [[nodiscard]] virtual size_t frame_count() const {
            return valid_frame_indices().size();
        }
    };

    typedef std::shared_ptr<const FrameIndexSource> FrameIndexSourcePtr;

    // Frames 0 .. count-1, e.g. an image stack or a multi-sweep recording.
    class FrameRange : public FrameIndexSource {
      public:
        explicit FrameRange(const int count = 0);

        [[nodiscard]] std::vector<int> valid_frame_indices() const override;
        [[nodiscard]] bool contains(const int frame) const override;
        [[nodiscard]] size_t frame_count() const override { return size_t(count_); }

        void set_frame_count(const int count);

      private:
        int count_{0};
    };

    // Arbitrary, possibly sparse, set of frame indices.
    class FrameIndexSet : public FrameIndexSource {
      public:
        FrameIndexSet() = default;
        explicit FrameIndexSet(const std::vector<int> &frames);

        [[nodiscard]] std::vector<int> valid_frame_indices() const override;
        [[nodiscard]] bool contains(const int frame) const override;
        [[nodiscard]] size_t frame_count() const override { return frames_.size(); }

        bool add_frame(const int frame);
        bool remove_frame(const int frame);
        void clear() { frames_.clear(); }

      private:
        std::set<int> frames_;
    };

} // namespace dataset
} // namespace framestate
