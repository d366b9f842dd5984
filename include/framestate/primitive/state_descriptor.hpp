// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <Imath/ImathColor.h>
#include <Imath/ImathVec.h>
#include <nlohmann/json.hpp>


namespace framestate {
namespace primitive {

    /* Struct StateDescriptor
    Geometry and appearance of a cursor or ROI in the frames governed by one
    state record. The frame visibility engine stores and hands these out but
    never looks inside. */
    struct StateDescriptor {

        StateDescriptor() { update_hash(); }
        StateDescriptor(const StateDescriptor &o) = default;
        StateDescriptor &operator=(const StateDescriptor &o) = default;

        static StateDescriptor Cursor(
            const Imath::V2f &position,
            const Imath::V2f &window,
            const float radius,
            const Imath::C3f &colour = Imath::C3f(1.0f, 1.0f, 0.0f));

        static StateDescriptor
        Shape(const std::vector<Imath::V2f> &points, const Imath::C3f &colour);

        bool operator==(const StateDescriptor &o) const;
        bool operator!=(const StateDescriptor &o) const { return !(*this == o); }

        void set_position(const Imath::V2f &p) {
            position_ = p;
            update_hash();
        }

        void set_window(const Imath::V2f &w) {
            window_ = w;
            update_hash();
        }

        void set_radius(const float r) {
            radius_ = r;
            update_hash();
        }

        void set_colour(const Imath::C3f &c) {
            colour_ = c;
            update_hash();
        }

        void set_label(const std::string &l) {
            label_ = l;
            update_hash();
        }

        void add_point(const Imath::V2f &pt);

        [[nodiscard]] const Imath::V2f &position() const { return position_; }
        [[nodiscard]] const Imath::V2f &window() const { return window_; }
        [[nodiscard]] float radius() const { return radius_; }
        [[nodiscard]] const Imath::C3f &colour() const { return colour_; }
        [[nodiscard]] const std::string &label() const { return label_; }
        [[nodiscard]] const std::vector<Imath::V2f> &points() const { return points_; }
        [[nodiscard]] size_t hash() const { return hash_; }

        friend void to_json(nlohmann::json &j, const StateDescriptor &s);

      private:
        void update_hash(const bool update_with_last_point_only = false);

        Imath::V2f position_{0.0f, 0.0f};
        // horizontal and vertical window of a cursor
        Imath::V2f window_{0.0f, 0.0f};
        float radius_{0.0f};
        Imath::C3f colour_{1.0f, 1.0f, 0.0f};
        std::string label_;
        std::vector<Imath::V2f> points_;
        size_t hash_{0};
    };

    void to_json(nlohmann::json &j, const StateDescriptor &s);

} // namespace primitive
} // namespace framestate
