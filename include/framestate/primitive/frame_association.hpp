// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "framestate/primitive/enums.hpp"

namespace framestate {
namespace primitive {

    // Visible in every frame of the dataset.
    struct Ubiquitous {
        bool operator==(const Ubiquitous &) const { return true; }
    };

    // Visible in every frame except 'frame'.
    struct FrameAvoiding {
        int frame{0};
        bool operator==(const FrameAvoiding &o) const { return frame == o.frame; }
    };

    // Visible in 'frame' only.
    struct SingleFrame {
        int frame{0};
        bool operator==(const SingleFrame &o) const { return frame == o.frame; }
    };

    /* Class FrameAssociation
    The frame visibility rule attached to a state record. Instances can only
    be built through the static factories, which reject negative frame
    indices, so a FrameAssociation is always well formed. */
    class FrameAssociation {

      public:
        using Rule = std::variant<Ubiquitous, FrameAvoiding, SingleFrame>;

        FrameAssociation() = default;

        static FrameAssociation ubiquitous();
        static FrameAssociation frame_avoiding(const int frame);
        static FrameAssociation single_frame(const int frame);

        // Signed encoding used by editing code:
        //   nullopt -> Ubiquitous
        //   n >= 0  -> SingleFrame(n)
        //   n < 0   -> FrameAvoiding(-n - 1), i.e. -1 avoids frame 0
        static FrameAssociation from_encoded(const std::optional<int> &encoded);
        [[nodiscard]] std::optional<int> encoded() const;

        bool operator==(const FrameAssociation &o) const { return rule_ == o.rule_; }
        bool operator!=(const FrameAssociation &o) const { return !(*this == o); }

        [[nodiscard]] AssociationKind kind() const;

        // the single or avoided frame, empty for Ubiquitous
        [[nodiscard]] std::optional<int> frame() const;

        [[nodiscard]] bool is_ubiquitous() const {
            return std::holds_alternative<Ubiquitous>(rule_);
        }
        [[nodiscard]] bool is_frame_avoiding() const {
            return std::holds_alternative<FrameAvoiding>(rule_);
        }
        [[nodiscard]] bool is_single_frame() const {
            return std::holds_alternative<SingleFrame>(rule_);
        }

        [[nodiscard]] bool visible_in(const int frame) const;

        [[nodiscard]] const Rule &rule() const { return rule_; }

        [[nodiscard]] std::string to_string() const;

      private:
        explicit FrameAssociation(const Rule &rule) : rule_(rule) {}

        Rule rule_{Ubiquitous{}};
    };

    void to_json(nlohmann::json &j, const FrameAssociation &a);

} // namespace primitive
} // namespace framestate
