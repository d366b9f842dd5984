// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>

#include "framestate/primitive/frame_association.hpp"
#include "framestate/utility/error.hpp"

using namespace framestate;
using namespace framestate::primitive;


namespace {

template <class> inline constexpr bool always_false_v = false;

void check_frame(const int frame, const AssociationKind kind) {
    if (frame < 0)
        throw utility::FrameStateError(
            utility::framestate_error::malformed_association,
            fmt::format(
                "{} requires a non-negative frame index, got {}",
                AssociationKind_to_str(kind),
                frame));
}

} // anonymous namespace

FrameAssociation FrameAssociation::ubiquitous() { return FrameAssociation(Ubiquitous{}); }

FrameAssociation FrameAssociation::frame_avoiding(const int frame) {
    check_frame(frame, AssociationKind::FrameAvoiding);
    return FrameAssociation(FrameAvoiding{frame});
}

FrameAssociation FrameAssociation::single_frame(const int frame) {
    check_frame(frame, AssociationKind::SingleFrame);
    return FrameAssociation(SingleFrame{frame});
}

FrameAssociation FrameAssociation::from_encoded(const std::optional<int> &encoded) {
    if (!encoded)
        return ubiquitous();
    if (*encoded >= 0)
        return single_frame(*encoded);
    // -(n + 1) cannot overflow for any negative n
    return frame_avoiding(-(*encoded + 1));
}

std::optional<int> FrameAssociation::encoded() const {
    return std::visit(
        [](auto &&arg) -> std::optional<int> {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Ubiquitous>)
                return {};
            else if constexpr (std::is_same_v<T, FrameAvoiding>)
                return -arg.frame - 1;
            else if constexpr (std::is_same_v<T, SingleFrame>)
                return arg.frame;
            else
                static_assert(always_false_v<T>, "Missing encoding for frame association!");
        },
        rule_);
}

AssociationKind FrameAssociation::kind() const {
    if (std::holds_alternative<FrameAvoiding>(rule_))
        return AssociationKind::FrameAvoiding;
    if (std::holds_alternative<SingleFrame>(rule_))
        return AssociationKind::SingleFrame;
    return AssociationKind::Ubiquitous;
}

std::optional<int> FrameAssociation::frame() const {
    if (const auto *a = std::get_if<FrameAvoiding>(&rule_))
        return a->frame;
    if (const auto *s = std::get_if<SingleFrame>(&rule_))
        return s->frame;
    return {};
}

bool FrameAssociation::visible_in(const int frame) const {
    return std::visit(
        [frame](auto &&arg) -> bool {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Ubiquitous>)
                return true;
            else if constexpr (std::is_same_v<T, FrameAvoiding>)
                return frame != arg.frame;
            else if constexpr (std::is_same_v<T, SingleFrame>)
                return frame == arg.frame;
            else
                static_assert(always_false_v<T>, "Missing visibility rule!");
        },
        rule_);
}

std::string FrameAssociation::to_string() const {
    const auto f = frame();
    if (!f)
        return std::string(AssociationKind_to_str(kind()));
    return fmt::format("{}({})", AssociationKind_to_str(kind()), *f);
}

void framestate::primitive::to_json(nlohmann::json &j, const FrameAssociation &a) {

    j = nlohmann::json{{"kind", std::string(AssociationKind_to_str(a.kind()))}};
    if (const auto f = a.frame())
        j["frame"] = *f;
    else
        j["frame"] = nullptr;
}
