// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "framestate/primitive/enums.hpp"
#include "framestate/primitive/frame_visibility_engine.hpp"

namespace framestate {
namespace primitive {

    /* Class Primitive
    A cursor or ROI overlaid on a multi-frame dataset. The primitive owns
    its state records through a FrameVisibilityEngine; editing code reaches
    them via engine(), the rendering surface via current_record() or
    engine().active_record(). */
    class Primitive {

      public:
        Primitive(
            const PrimitiveType type,
            const std::string &name,
            dataset::FrameIndexSourcePtr frames = {},
            const EngineOptions &options        = {});

        Primitive(
            const PrimitiveType type,
            const std::string &name,
            const StateDescriptor &initial_state,
            dataset::FrameIndexSourcePtr frames = {},
            const EngineOptions &options        = {});

        Primitive(const Primitive &o) = default;

        bool operator==(const Primitive &o) const {
            return type_ == o.type_ && name_ == o.name_ && engine_ == o.engine_;
        }

        [[nodiscard]] PrimitiveType type() const { return type_; }

        [[nodiscard]] const std::string &name() const { return name_; }
        void set_name(const std::string &name) { name_ = name; }

        FrameVisibilityEngine &engine() { return engine_; }
        [[nodiscard]] const FrameVisibilityEngine &engine() const { return engine_; }

        [[nodiscard]] int current_frame() const { return current_frame_; }

        // Frame changed in the viewer. Returns true if the primitive has a
        // state, i.e. is visible, in the new frame.
        bool set_current_frame(const int frame);

        [[nodiscard]] std::optional<StateRecord> current_record() const;
        [[nodiscard]] bool visible() const;

        // Re-link the primitive to a list of frames. An empty list makes the
        // governing state ubiquitous, otherwise the primitive ends up with
        // one single frame record per listed frame, each holding the state
        // governing the current frame (or the first record).
        void set_frame_visibility(const std::vector<int> &frames);

        // Ascending frames the primitive is visible in, empty when it is
        // ubiquitous. With a frame avoiding record the dataset frames it is
        // visible in are listed, otherwise the single frame records' frames.
        [[nodiscard]] std::vector<int> frame_visibility() const;

        // The dataset gained or lost frames.
        std::vector<RecordId> frames_changed();

        [[nodiscard]] size_t hash() const { return engine_.hash(); }

      private:
        PrimitiveType type_;
        std::string name_;
        int current_frame_{0};
        FrameVisibilityEngine engine_;
    };

    typedef std::shared_ptr<Primitive> PrimitivePtr;

    void to_json(nlohmann::json &j, const Primitive &p);

} // namespace primitive
} // namespace framestate
