// SPDX-License-Identifier: Apache-2.0

#include <cstdint>
#include <cstring>
#include <functional>

#include "framestate/primitive/state_descriptor.hpp"

using namespace framestate::primitive;

namespace {

inline size_t hash_combine(float _lhs, size_t rhs) {
    uint32_t v;
    std::memcpy(&v, &_lhs, sizeof(v));
    size_t lhs = size_t(v);
    lhs ^= rhs + 0x9e3779b9 + (lhs << 6) + (lhs >> 2);
    return lhs;
}

} // anonymous namespace

void StateDescriptor::update_hash(const bool update_with_last_point_only) {

    if (update_with_last_point_only && points_.size()) {
        hash_ = hash_combine(points_.back().x, hash_);
        hash_ = hash_combine(points_.back().y, hash_);
    } else {
        hash_ = std::hash<std::string>{}(label_);
        hash_ = hash_combine(position_.x, hash_);
        hash_ = hash_combine(position_.y, hash_);
        hash_ = hash_combine(window_.x, hash_);
        hash_ = hash_combine(window_.y, hash_);
        hash_ = hash_combine(radius_, hash_);
        hash_ = hash_combine(colour_.x, hash_);
        hash_ = hash_combine(colour_.y, hash_);
        hash_ = hash_combine(colour_.z, hash_);
        for (const auto &pt : points_) {
            hash_ = hash_combine(pt.x, hash_);
            hash_ = hash_combine(pt.y, hash_);
        }
    }
}

StateDescriptor StateDescriptor::Cursor(
    const Imath::V2f &position,
    const Imath::V2f &window,
    const float radius,
    const Imath::C3f &colour) {

    StateDescriptor s;
    s.position_ = position;
    s.window_   = window;
    s.radius_   = radius;
    s.colour_   = colour;
    s.update_hash();
    return s;
}

StateDescriptor
StateDescriptor::Shape(const std::vector<Imath::V2f> &points, const Imath::C3f &colour) {

    StateDescriptor s;
    s.points_ = points;
    s.colour_ = colour;
    if (!points.empty())
        s.position_ = points.front();
    s.update_hash();
    return s;
}

bool StateDescriptor::operator==(const StateDescriptor &o) const {
    return (
        position_ == o.position_ && window_ == o.window_ &&
        radius_ == o.radius_ && colour_ == o.colour_ && label_ == o.label_ &&
        points_ == o.points_);
}

void StateDescriptor::add_point(const Imath::V2f &pt) {
    points_.push_back(pt);
    update_hash(true);
}

void framestate::primitive::to_json(nlohmann::json &j, const StateDescriptor &s) {

    j = nlohmann::json{
        {"x", s.position_.x},
        {"y", s.position_.y},
        {"xwindow", s.window_.x},
        {"ywindow", s.window_.y},
        {"radius", s.radius_},
        {"r", s.colour_.x},
        {"g", s.colour_.y},
        {"b", s.colour_.z},
        {"label", s.label_}};

    std::vector<float> pts;
    pts.reserve(s.points_.size() * 2);
    for (const auto &pt : s.points_) {
        pts.push_back(pt.x);
        pts.push_back(pt.y);
    }
    j["points"] = pts;
}
