// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <random>

#include "framestate/primitive/frame_visibility_engine.hpp"
#include "framestate/utility/error.hpp"

using namespace framestate;
using namespace framestate::primitive;

namespace framestate {
namespace primitive {

    struct FrameVisibilityEngineTestAccess {

        static void
        seed(FrameVisibilityEngine &e, const FrameVisibilityEngine::RecordVec &records) {
            std::unique_lock l(e.mutex_);
            e.records_ = records;
        }

        static void
        commit(FrameVisibilityEngine &e, const FrameVisibilityEngine::RecordVec &records) {
            std::unique_lock l(e.mutex_);
            auto copy = records;
            e.commit(std::move(copy), e.next_record_id_);
        }
    };

} // namespace primitive
} // namespace framestate

namespace {

StateDescriptor cursor_at(const float x, const float y) {
    return StateDescriptor::Cursor(Imath::V2f(x, y), Imath::V2f(10.0f, 10.0f), 0.0f);
}

std::vector<int> single_frames(const FrameVisibilityEngine &engine) {
    std::vector<int> result;
    for (const auto &r : engine.records()) {
        if (r.association.is_single_frame())
            result.push_back(*r.association.frame());
    }
    std::sort(result.begin(), result.end());
    return result;
}

utility::framestate_error error_code_of(const std::function<void()> &f) {
    try {
        f();
    } catch (const utility::FrameStateError &e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a FrameStateError";
    return utility::framestate_error::inconsistent_state;
}

} // namespace

TEST(FrameVisibilityEngineTest, EmptyEngineHasNoActiveRecord) {
    FrameVisibilityEngine engine(std::make_shared<dataset::FrameRange>(4));

    EXPECT_TRUE(engine.empty());
    EXPECT_FALSE(engine.active_record(0));
    EXPECT_FALSE(engine.has_state_for_frame(3));
    EXPECT_TRUE(engine.visible_frames().empty());
}

TEST(FrameVisibilityEngineTest, InitialStateIsUbiquitous) {
    FrameVisibilityEngine engine(cursor_at(1.0f, 2.0f));

    ASSERT_EQ(engine.size(), 1);
    EXPECT_TRUE(engine.records().front().association.is_ubiquitous());
    // frames need not exist in the dataset
    for (const auto frame : {0, 1, 57, 100000}) {
        auto r = engine.active_record(frame);
        ASSERT_TRUE(r);
        EXPECT_EQ(r->state, cursor_at(1.0f, 2.0f));
    }
}

TEST(FrameVisibilityEngineTest, UbiquitousIsIdempotent) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto id = engine.records().front().id;

    engine.reassign(id, FrameAssociation::ubiquitous());
    const auto first = engine.records();
    engine.reassign(id, FrameAssociation::ubiquitous());

    EXPECT_EQ(engine.records(), first);
    ASSERT_EQ(first.size(), 1);
    EXPECT_EQ(first.front().id, id);
}

TEST(FrameVisibilityEngineTest, UbiquitousDiscardsEveryOtherRecord) {
    FrameVisibilityEngine engine;
    const auto a = engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));
    const auto b = engine.add_state(cursor_at(2.0f, 2.0f), FrameAssociation::single_frame(2));
    engine.add_state(cursor_at(3.0f, 3.0f), FrameAssociation::single_frame(3));

    engine.reassign(b, FrameAssociation::ubiquitous());

    ASSERT_EQ(engine.size(), 1);
    EXPECT_FALSE(engine.contains(a));
    EXPECT_EQ(engine.active_record(1)->id, b);
    EXPECT_EQ(engine.active_record(3)->state, cursor_at(2.0f, 2.0f));
}

TEST(FrameVisibilityEngineTest, SingleFrameSlotReplacement) {
    FrameVisibilityEngine engine;
    const auto at2 = engine.add_state(cursor_at(2.0f, 0.0f), FrameAssociation::single_frame(2));
    const auto at5 = engine.add_state(cursor_at(5.0f, 0.0f), FrameAssociation::single_frame(5));
    const auto other =
        engine.add_state(cursor_at(7.0f, 0.0f), FrameAssociation::single_frame(7));

    engine.reassign(other, FrameAssociation::single_frame(2));

    ASSERT_EQ(engine.size(), 2);
    EXPECT_FALSE(engine.contains(at2));
    EXPECT_EQ(engine.active_record(2)->id, other);
    EXPECT_EQ(engine.active_record(5)->id, at5);
    EXPECT_FALSE(engine.active_record(7));
}

TEST(FrameVisibilityEngineTest, AddedSingleFrameTakesOccupiedSlot) {
    FrameVisibilityEngine engine;
    const auto at2 = engine.add_state(cursor_at(2.0f, 0.0f), FrameAssociation::single_frame(2));
    const auto at5 = engine.add_state(cursor_at(5.0f, 0.0f), FrameAssociation::single_frame(5));

    const auto fresh =
        engine.add_state(cursor_at(9.0f, 9.0f), FrameAssociation::single_frame(2));

    EXPECT_FALSE(engine.contains(at2));
    EXPECT_TRUE(engine.contains(at5));
    EXPECT_EQ(engine.active_record(2)->id, fresh);
    EXPECT_EQ(single_frames(engine), std::vector<int>({2, 5}));
}

TEST(FrameVisibilityEngineTest, AvoidingAndSingleFrameCoexist) {
    auto frames = std::make_shared<dataset::FrameRange>(5);
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(3));

    const auto single = engine.add_state(cursor_at(3.0f, 3.0f), FrameAssociation::single_frame(3));

    ASSERT_EQ(engine.size(), 2);
    EXPECT_EQ(engine.find(avoiding)->association, FrameAssociation::frame_avoiding(3));
    EXPECT_EQ(engine.find(single)->association, FrameAssociation::single_frame(3));

    EXPECT_EQ(engine.active_record(3)->id, single);
    for (const auto k : {0, 1, 2, 4}) {
        EXPECT_EQ(engine.active_record(k)->id, avoiding) << "frame " << k;
    }
    EXPECT_EQ(engine.visible_frames(), std::vector<int>({0, 1, 2, 3, 4}));
}

TEST(FrameVisibilityEngineTest, ConflictingSingleFrameExpandsAvoidingRecord) {
    auto frames = std::make_shared<dataset::FrameRange>(5);
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(3));

    const auto single = engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));

    EXPECT_FALSE(engine.contains(avoiding));
    EXPECT_EQ(engine.size(), 4);
    EXPECT_EQ(single_frames(engine), std::vector<int>({0, 1, 2, 4}));
    EXPECT_FALSE(engine.active_record(3));
    EXPECT_EQ(engine.active_record(1)->id, single);

    // materialised records carry the payload of the avoiding record
    for (const auto k : {0, 2, 4}) {
        auto r = engine.active_record(k);
        ASSERT_TRUE(r);
        EXPECT_NE(r->id, single);
        EXPECT_NE(r->id, avoiding);
        EXPECT_EQ(r->state, cursor_at(0.0f, 0.0f));
    }
    EXPECT_TRUE(engine.check_invariants());
}

TEST(FrameVisibilityEngineTest, ExpansionKeepsRecordOrder) {
    auto frames = std::make_shared<dataset::FrameRange>(4);
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(0));

    const auto single = engine.add_state(cursor_at(2.0f, 2.0f), FrameAssociation::single_frame(2));

    const auto records = engine.records();
    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0].association, FrameAssociation::single_frame(1));
    EXPECT_EQ(records[1].association, FrameAssociation::single_frame(3));
    EXPECT_EQ(records[2].id, single);
}

TEST(FrameVisibilityEngineTest, MovingGapFillerAwayExpandsAvoidingRecord) {
    auto frames = std::make_shared<dataset::FrameRange>(5);
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(3));
    const auto filler = engine.add_state(cursor_at(3.0f, 3.0f), FrameAssociation::single_frame(3));

    engine.reassign(filler, FrameAssociation::single_frame(1));

    EXPECT_EQ(single_frames(engine), std::vector<int>({0, 1, 2, 4}));
    EXPECT_EQ(engine.active_record(1)->id, filler);
    EXPECT_FALSE(engine.active_record(3));
}

TEST(FrameVisibilityEngineTest, ExpansionWithoutFramesDiscardsAvoidingRecord) {
    auto frames = std::make_shared<dataset::FrameRange>(0);
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(3));

    const auto single = engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));

    ASSERT_EQ(engine.size(), 1);
    EXPECT_EQ(engine.records().front().id, single);

    // same policy when no dataset is attached at all
    FrameVisibilityEngine detached(cursor_at(0.0f, 0.0f));
    detached.reassign(detached.records().front().id, FrameAssociation::frame_avoiding(3));
    detached.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));
    EXPECT_EQ(detached.size(), 1);
}

TEST(FrameVisibilityEngineTest, ExpansionSkipsFramesOutsideSparseDataset) {
    auto frames = std::make_shared<dataset::FrameIndexSet>(std::vector<int>{0, 4, 8, 12});
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), frames);
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(8));

    engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(4));

    EXPECT_EQ(single_frames(engine), std::vector<int>({0, 4, 12}));
    EXPECT_FALSE(engine.active_record(2));
    EXPECT_FALSE(engine.active_record(8));
}

TEST(FrameVisibilityEngineTest, FrameAvoidingKeepsOnlyTheGapFiller) {
    FrameVisibilityEngine engine;
    const auto a = engine.add_state(cursor_at(2.0f, 0.0f), FrameAssociation::single_frame(2));
    const auto b = engine.add_state(cursor_at(5.0f, 0.0f), FrameAssociation::single_frame(5));
    const auto c = engine.add_state(cursor_at(7.0f, 0.0f), FrameAssociation::single_frame(7));

    engine.reassign(a, FrameAssociation::frame_avoiding(5));

    ASSERT_EQ(engine.size(), 2);
    EXPECT_TRUE(engine.contains(b));
    EXPECT_FALSE(engine.contains(c));
    EXPECT_EQ(engine.active_record(5)->id, b);
    EXPECT_EQ(engine.active_record(7)->id, a);
    EXPECT_EQ(engine.active_record(2)->id, a);
}

TEST(FrameVisibilityEngineTest, FrameAvoidingReplacesOtherAvoidingRecord) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto first = engine.records().front().id;
    engine.reassign(first, FrameAssociation::frame_avoiding(1));

    const auto second =
        engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::frame_avoiding(2));

    ASSERT_EQ(engine.size(), 1);
    EXPECT_EQ(engine.records().front().id, second);
    EXPECT_FALSE(engine.active_record(2));
}

TEST(FrameVisibilityEngineTest, AddedSingleFrameNarrowsUbiquitousRecord) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto everywhere = engine.records().front().id;

    const auto single = engine.add_state(cursor_at(2.0f, 2.0f), FrameAssociation::single_frame(2));

    EXPECT_EQ(engine.find(everywhere)->association, FrameAssociation::frame_avoiding(2));
    EXPECT_EQ(engine.active_record(2)->id, single);
    EXPECT_EQ(engine.active_record(0)->id, everywhere);
    EXPECT_EQ(engine.active_record(3)->id, everywhere);
}

TEST(FrameVisibilityEngineTest, AvoidingRecordReassignedToItsOwnGap) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto avoiding = engine.records().front().id;
    engine.reassign(avoiding, FrameAssociation::frame_avoiding(3));
    const auto filler = engine.add_state(cursor_at(3.0f, 3.0f), FrameAssociation::single_frame(3));

    engine.reassign(avoiding, FrameAssociation::single_frame(3));

    ASSERT_EQ(engine.size(), 1);
    EXPECT_FALSE(engine.contains(filler));
    EXPECT_EQ(engine.active_record(3)->id, avoiding);
    EXPECT_FALSE(engine.active_record(0));
}

TEST(FrameVisibilityEngineTest, EncodedAssociations) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto id = engine.records().front().id;

    engine.reassign_encoded(id, -1);
    EXPECT_EQ(engine.find(id)->association, FrameAssociation::frame_avoiding(0));

    engine.reassign_encoded(id, 4);
    EXPECT_EQ(engine.find(id)->association, FrameAssociation::single_frame(4));

    engine.reassign_encoded(id, std::nullopt);
    EXPECT_TRUE(engine.find(id)->association.is_ubiquitous());
}

TEST(FrameVisibilityEngineTest, InvalidTargetLeavesRecordsUntouched) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    const auto before = engine.records();
    const auto hash   = engine.hash();

    EXPECT_EQ(
        error_code_of([&]() { engine.reassign(42, FrameAssociation::single_frame(1)); }),
        utility::framestate_error::invalid_target);
    EXPECT_EQ(
        error_code_of([&]() { engine.set_state(42, cursor_at(1.0f, 1.0f)); }),
        utility::framestate_error::invalid_target);

    EXPECT_EQ(engine.records(), before);
    EXPECT_EQ(engine.hash(), hash);
}

TEST(FrameVisibilityEngineTest, DiscardedRecordIsNoLongerATarget) {
    FrameVisibilityEngine engine;
    const auto a = engine.add_state(cursor_at(0.0f, 0.0f), FrameAssociation::single_frame(1));
    engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));

    EXPECT_THROW(
        engine.reassign(a, FrameAssociation::ubiquitous()), utility::FrameStateError);
}

TEST(FrameVisibilityEngineTest, MalformedAssociationsAreRejected) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));

    EXPECT_EQ(
        error_code_of([]() { FrameAssociation::single_frame(-1); }),
        utility::framestate_error::malformed_association);
    EXPECT_EQ(
        error_code_of([&]() { engine.active_record(-2); }),
        utility::framestate_error::malformed_association);
    EXPECT_EQ(engine.size(), 1);
}

TEST(FrameVisibilityEngineTest, SetStateKeepsAssociation) {
    FrameVisibilityEngine engine;
    const auto id = engine.add_state(cursor_at(0.0f, 0.0f), FrameAssociation::single_frame(6));
    const auto hash = engine.hash();

    engine.set_state(id, cursor_at(4.0f, 4.0f));

    EXPECT_EQ(engine.active_record(6)->state, cursor_at(4.0f, 4.0f));
    EXPECT_EQ(engine.find(id)->association, FrameAssociation::single_frame(6));
    EXPECT_NE(engine.hash(), hash);
}

TEST(FrameVisibilityEngineTest, OrphanedRecordsAreReportedNotRemoved) {
    auto frames = std::make_shared<dataset::FrameIndexSet>(std::vector<int>{0, 1, 2, 3});
    FrameVisibilityEngine engine(frames);
    const auto at1 = engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));
    const auto at3 = engine.add_state(cursor_at(3.0f, 3.0f), FrameAssociation::single_frame(3));

    EXPECT_EQ(engine.visible_frames(), std::vector<int>({1, 3}));
    EXPECT_TRUE(engine.orphaned_records().empty());

    frames->remove_frame(3);
    const auto orphans = engine.dataset_changed();

    EXPECT_EQ(orphans, std::vector<RecordId>({at3}));
    EXPECT_TRUE(engine.contains(at1));
    EXPECT_TRUE(engine.contains(at3));
    EXPECT_EQ(engine.visible_frames(), std::vector<int>({1}));
}

TEST(FrameVisibilityEngineTest, InvariantCheckDetectsBrokenSequences) {
    StateRecord everywhere;
    everywhere.id          = 0;
    everywhere.association = FrameAssociation::ubiquitous();

    StateRecord at2;
    at2.id          = 1;
    at2.association = FrameAssociation::single_frame(2);

    StateRecord also_at2;
    also_at2.id          = 2;
    also_at2.association = FrameAssociation::single_frame(2);

    StateRecord avoid4;
    avoid4.id          = 3;
    avoid4.association = FrameAssociation::frame_avoiding(4);

    std::string reason;
    EXPECT_FALSE(FrameVisibilityEngine::check_invariants({everywhere, at2}, &reason));
    EXPECT_FALSE(reason.empty());
    EXPECT_FALSE(FrameVisibilityEngine::check_invariants({at2, also_at2}));
    EXPECT_FALSE(FrameVisibilityEngine::check_invariants({avoid4, at2}));
    EXPECT_FALSE(FrameVisibilityEngine::check_invariants({at2, at2}));

    StateRecord avoid2 = avoid4;
    avoid2.id          = 4;
    avoid2.association = FrameAssociation::frame_avoiding(2);
    EXPECT_TRUE(FrameVisibilityEngine::check_invariants({avoid2, at2}));
    EXPECT_FALSE(FrameVisibilityEngine::check_invariants({avoid2, at2, avoid4}));
    EXPECT_TRUE(FrameVisibilityEngine::check_invariants({}));
}

TEST(FrameVisibilityEngineTest, QueryRefusesOverlappingRecords) {
    StateRecord everywhere;
    everywhere.id          = 0;
    everywhere.association = FrameAssociation::ubiquitous();
    everywhere.state       = cursor_at(0.0f, 0.0f);

    StateRecord at2;
    at2.id          = 1;
    at2.association = FrameAssociation::single_frame(2);
    at2.state       = cursor_at(2.0f, 2.0f);

    FrameVisibilityEngine engine(std::make_shared<dataset::FrameRange>(4));
    FrameVisibilityEngineTestAccess::seed(engine, {everywhere, at2});

    EXPECT_FALSE(engine.check_invariants());
    EXPECT_EQ(
        error_code_of([&]() { (void)engine.active_record(2); }),
        utility::framestate_error::inconsistent_state);
    EXPECT_EQ(engine.active_record(1)->id, everywhere.id);

    // without verification the first candidate wins
    EngineOptions unchecked;
    unchecked.verify_invariants = false;
    FrameVisibilityEngine lenient(std::make_shared<dataset::FrameRange>(4), unchecked);
    FrameVisibilityEngineTestAccess::seed(lenient, {everywhere, at2});
    EXPECT_EQ(lenient.active_record(2)->id, everywhere.id);
}

TEST(FrameVisibilityEngineTest, CommitRefusesBrokenSequences) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f), std::make_shared<dataset::FrameRange>(4));
    const auto before = engine.records();
    const auto hash   = engine.hash();

    StateRecord at1;
    at1.id          = 5;
    at1.association = FrameAssociation::single_frame(1);

    StateRecord also_at1 = at1;
    also_at1.id          = 6;

    EXPECT_EQ(
        error_code_of([&]() { FrameVisibilityEngineTestAccess::commit(engine, {at1, also_at1}); }),
        utility::framestate_error::inconsistent_state);
    EXPECT_EQ(engine.records(), before);
    EXPECT_EQ(engine.hash(), hash);

    FrameVisibilityEngineTestAccess::commit(engine, {at1});
    EXPECT_EQ(engine.active_record(1)->id, at1.id);
}

TEST(FrameVisibilityEngineTest, CopiesCompareEqualAndAreIndependent) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    FrameVisibilityEngine copy(engine);
    EXPECT_TRUE(copy == engine);

    copy.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));
    EXPECT_FALSE(copy == engine);
    EXPECT_EQ(engine.size(), 1);

    engine = copy;
    EXPECT_TRUE(copy == engine);
}

TEST(FrameVisibilityEngineTest, JsonListing) {
    FrameVisibilityEngine engine(cursor_at(0.0f, 0.0f));
    engine.add_state(cursor_at(1.0f, 1.0f), FrameAssociation::single_frame(1));

    const nlohmann::json j(engine);
    ASSERT_EQ(j["records"].size(), 2);
    EXPECT_EQ(j["records"][0]["association"]["kind"].get<std::string>(), "FrameAvoiding");
    EXPECT_EQ(j["records"][0]["association"]["frame"].get<int>(), 1);
    EXPECT_EQ(j["records"][1]["association"]["kind"].get<std::string>(), "SingleFrame");
}

TEST(FrameVisibilityEngineTest, RandomReassignmentsPreserveInvariants) {
    std::mt19937 rng(20261019);
    std::uniform_int_distribution<int> frame_dist(0, 9);
    std::uniform_int_distribution<int> kind_dist(0, 2);
    std::uniform_int_distribution<int> op_dist(0, 3);

    auto frames = std::make_shared<dataset::FrameRange>(8);
    FrameVisibilityEngine engine(frames);

    auto random_association = [&]() {
        switch (kind_dist(rng)) {
        case 0:
            return FrameAssociation::ubiquitous();
        case 1:
            return FrameAssociation::frame_avoiding(frame_dist(rng));
        default:
            return FrameAssociation::single_frame(frame_dist(rng));
        }
    };

    for (int step = 0; step < 2000; ++step) {
        const auto association = random_association();
        if (engine.empty() || op_dist(rng) == 0) {
            engine.add_state(cursor_at(float(step), 0.0f), association);
        } else {
            const auto records = engine.records();
            std::uniform_int_distribution<size_t> pick(0, records.size() - 1);
            const auto target = records[pick(rng)].id;
            engine.reassign(target, association);
            auto r = engine.find(target);
            ASSERT_TRUE(r);
            EXPECT_EQ(r->association, association);
        }

        ASSERT_TRUE(engine.check_invariants()) << "step " << step;
        for (int f = 0; f < 10; ++f) {
            ASSERT_NO_THROW(engine.active_record(f)) << "step " << step << " frame " << f;
        }
    }
}
