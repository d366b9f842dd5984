// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "framestate/dataset/frame_index_source.hpp"
#include "framestate/primitive/state_record.hpp"
#include "framestate/utility/json_store.hpp"

namespace framestate {
namespace primitive {

    struct EngineOptions {
        // verify I1-I5 on every new record sequence before it is committed
        // and count candidates on every active record query
        bool verify_invariants{true};

        static EngineOptions from_preferences(const utility::JsonStore &prefs);
    };

    /* Class FrameVisibilityEngine

    Owns the ordered state records of one primitive and resolves, for any
    frame, the single record governing that frame. After every mutation the
    records satisfy:

      I1 at most one record is visible in any frame
      I2 a Ubiquitous record is the only record
      I3 at most one FrameAvoiding record
      I4 a FrameAvoiding(f) record may only be accompanied by SingleFrame(f)
      I5 SingleFrame records have pairwise distinct frames

    Records are only ever created by add_state() and re-linked by
    reassign(). Both build a complete new sequence and swap it in, so a
    throwing call leaves the engine untouched.

    Note this class is thread safe EXCEPT for the begin()/end() iterators.
    When looping over the iterators call 'read_lock()' first and
    'read_unlock()' afterwards.
    */
    class FrameVisibilityEngine {

      public:
        using RecordVec = std::vector<StateRecord>;
        using clock     = std::chrono::steady_clock;

        explicit FrameVisibilityEngine(
            dataset::FrameIndexSourcePtr frames = {}, const EngineOptions &options = {});

        // starts with a single Ubiquitous record holding initial_state
        explicit FrameVisibilityEngine(
            const StateDescriptor &initial_state,
            dataset::FrameIndexSourcePtr frames = {},
            const EngineOptions &options        = {});

        FrameVisibilityEngine(const FrameVisibilityEngine &o);
        FrameVisibilityEngine &operator=(const FrameVisibilityEngine &o);

        bool operator==(const FrameVisibilityEngine &o) const;

        RecordVec::const_iterator begin() const { return records_.begin(); }
        RecordVec::const_iterator end() const { return records_.end(); }

        // call this before using the above iterators
        void read_lock() const { mutex_.lock_shared(); }

        // call this after using the above iterators
        void read_unlock() const { mutex_.unlock_shared(); }

        // The record visible in frame, if any. frame need not exist in the
        // dataset. Throws MalformedAssociation for negative frames.
        [[nodiscard]] std::optional<StateRecord> active_record(const int frame) const;

        [[nodiscard]] bool has_state_for_frame(const int frame) const;

        [[nodiscard]] std::optional<StateRecord> find(const RecordId id) const;
        [[nodiscard]] bool contains(const RecordId id) const;

        [[nodiscard]] RecordVec records() const;
        [[nodiscard]] size_t size() const;
        [[nodiscard]] bool empty() const;

        // dataset frames in which some record is visible
        [[nodiscard]] std::vector<int> visible_frames() const;

        // records tied to a frame that the dataset no longer provides
        [[nodiscard]] std::vector<RecordId> orphaned_records() const;

        [[nodiscard]] bool check_invariants() const;
        static bool check_invariants(const RecordVec &records, std::string *reason = nullptr);

        // Create a record and link it with 'association', applying the same
        // rules as reassign() with the new record as the target.
        RecordId add_state(const StateDescriptor &state, const FrameAssociation &association);

        // Throws InvalidTarget if target is not a current record.
        void reassign(const RecordId target, const FrameAssociation &association);

        // Signed-integer form, see FrameAssociation::from_encoded.
        void reassign_encoded(const RecordId target, const std::optional<int> &encoded);

        // Replace the payload of a record, its association is unchanged.
        void set_state(const RecordId target, const StateDescriptor &state);

        void set_frame_source(dataset::FrameIndexSourcePtr frames);
        [[nodiscard]] dataset::FrameIndexSourcePtr frame_source() const;

        // Called when frames were added to or removed from the dataset.
        // Records are never rewritten here, returns orphaned_records().
        std::vector<RecordId> dataset_changed();

        [[nodiscard]] const EngineOptions &options() const { return options_; }

        [[nodiscard]] size_t hash() const { return hash_; }

        [[nodiscard]] const clock::time_point &last_change_time() const {
            return last_change_time_;
        }

      private:
        [[nodiscard]] RecordVec relink(
            const RecordVec &records,
            const size_t target_idx,
            const FrameAssociation &association,
            RecordId &next_id) const;

        [[nodiscard]] std::vector<int> valid_frames() const;
        [[nodiscard]] std::vector<RecordId> orphaned_records_no_lock() const;
        [[nodiscard]] size_t index_of(const RecordId id) const;

        void commit(RecordVec &&records, const RecordId next_id);
        void changed();

        friend void to_json(nlohmann::json &j, const FrameVisibilityEngine &e);

        // lets the unit tests seed record sequences the public api refuses
        friend struct FrameVisibilityEngineTestAccess;

      private:
        clock::time_point last_change_time_;
        RecordVec records_;
        RecordId next_record_id_{0};
        dataset::FrameIndexSourcePtr frames_;
        EngineOptions options_;
        size_t hash_{0};

        mutable std::shared_mutex mutex_;
    };

    void to_json(nlohmann::json &j, const FrameVisibilityEngine &e);

} // namespace primitive
} // namespace framestate
