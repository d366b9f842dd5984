// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace framestate {
namespace utility {

    enum class framestate_error { invalid_target, malformed_association, inconsistent_state };

    constexpr std::string_view to_string(framestate_error err) {
        switch (err) {
        case framestate_error::invalid_target:
            return "InvalidTarget";
        case framestate_error::malformed_association:
            return "MalformedAssociation";
        case framestate_error::inconsistent_state:
            return "InconsistentState";
        default:
            return "Undefined";
        }
    }

    class FrameStateError : public std::runtime_error {
      public:
        FrameStateError(const framestate_error code, const std::string &what)
            : std::runtime_error(
                  fmt::format("{}: {}", std::string(utility::to_string(code)), what)),
              code_(code) {}

        [[nodiscard]] framestate_error code() const { return code_; }

      private:
        framestate_error code_;
    };

} // namespace utility
} // namespace framestate
