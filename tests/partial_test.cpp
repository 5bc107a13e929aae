//! # Partial Value Tests
//!
//! Values under construction must be torn down exactly once, whatever
//! point a failure interrupts them.

#include "test_types.hpp"

#include <gtest/gtest.h>
#include <array>
#include <memory>

using namespace prism;
using namespace prism::json;
using namespace fixtures;

// ============================================================================
// Building Blocks
// ============================================================================

class PartialTest : public ::testing::Test {
protected:
    void SetUp() override {
        baseline_ = Tracked::live;
    }

    void TearDown() override {
        EXPECT_EQ(Tracked::live, baseline_);
    }

    [[nodiscard]] auto extra() const -> int {
        return Tracked::live - baseline_;
    }

private:
    int baseline_ = 0;
};

TEST_F(PartialTest, SlotDropsOnlyWhenInitialized) {
    const Shape& shape = shape_of<Tracked>();
    {
        Slot slot(shape);
        EXPECT_FALSE(slot.initialized());
    }
    {
        Slot slot(shape);
        shape.vtable.default_in_place(slot.get());
        slot.mark_initialized();
        EXPECT_EQ(extra(), 1);
    }
    EXPECT_EQ(extra(), 0);
}

TEST_F(PartialTest, SlotResetAllowsReuse) {
    const Shape& shape = shape_of<Tracked>();
    Slot slot(shape);
    shape.vtable.default_in_place(slot.get());
    slot.mark_initialized();
    slot.reset();
    EXPECT_FALSE(slot.initialized());
    EXPECT_EQ(extra(), 0);
}

TEST_F(PartialTest, LargeValuesUseHeapStorage) {
    using Big = std::array<int64_t, 32>;
    const Shape& shape = shape_of<Big>();
    Slot slot(shape);
    shape.vtable.default_in_place(slot.get());
    slot.mark_initialized();
    EXPECT_EQ(reinterpret_cast<uintptr_t>(slot.get()) % alignof(Big), 0u);
    static_cast<Big*>(slot.get())->back() = 9;
    EXPECT_EQ((*static_cast<Big*>(slot.get()))[31], 9);
}

TEST_F(PartialTest, FrameDropsMarkedFields) {
    const Shape& shape = shape_of<Guarded>();
    alignas(Guarded) unsigned char storage[sizeof(Guarded)];
    {
        StructFrame frame(shape, storage);
        const Shape& tracked = shape_of<Tracked>();
        tracked.vtable.default_in_place(frame.field_ptr(0));
        frame.mark(0);
        tracked.vtable.default_in_place(frame.field_ptr(1));
        frame.mark(1);
        EXPECT_EQ(frame.count(), 2u);
        EXPECT_TRUE(frame.is_set(1));
        EXPECT_FALSE(frame.is_set(2));
        EXPECT_EQ(extra(), 2);
    }
    EXPECT_EQ(extra(), 0);
}

TEST_F(PartialTest, FrameUnsetDropsOneField) {
    const Shape& shape = shape_of<Guarded>();
    alignas(Guarded) unsigned char storage[sizeof(Guarded)];
    StructFrame frame(shape, storage);
    shape_of<Tracked>().vtable.default_in_place(frame.field_ptr(0));
    frame.mark(0);
    frame.unset(0);
    EXPECT_FALSE(frame.is_set(0));
    EXPECT_EQ(frame.count(), 0u);
    EXPECT_EQ(extra(), 0);
}

TEST_F(PartialTest, CommittedFrameHandsOverOwnership) {
    const Shape& shape = shape_of<Guarded>();
    alignas(Guarded) unsigned char storage[sizeof(Guarded)];
    {
        StructFrame frame(shape, storage);
        for (size_t i = 0; i < frame.fields().size(); ++i) {
            frame.fields()[i].shape().vtable.default_in_place(frame.field_ptr(i));
            frame.mark(i);
        }
        frame.commit();
    }
    EXPECT_EQ(extra(), 2);
    shape.vtable.drop(storage);
}

TEST_F(PartialTest, ValueGuardDropsUnlessReleased) {
    const Shape& shape = shape_of<std::vector<Tracked>>();
    alignas(std::vector<Tracked>) unsigned char storage[sizeof(std::vector<Tracked>)];
    std::construct_at(reinterpret_cast<std::vector<Tracked>*>(storage), 3);
    {
        ValueGuard guard(shape, storage);
        EXPECT_EQ(extra(), 3);
    }
    EXPECT_EQ(extra(), 0);

    std::construct_at(reinterpret_cast<std::vector<Tracked>*>(storage), 2);
    {
        ValueGuard guard(shape, storage);
        guard.release();
    }
    EXPECT_EQ(extra(), 2);
    shape.vtable.drop(storage);
}

// ============================================================================
// Failures During Deserialization
// ============================================================================

TEST_F(PartialTest, FailureMidStruct) {
    auto result = from_str<Guarded>(R"({"first": 1, "second": 2, "check": 3})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::InvalidValue);
}

TEST_F(PartialTest, MissingFieldAfterOthersBuilt) {
    auto result = from_str<Guarded>(R"({"second": 2, "first": 1})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "missing field `check`");
}

TEST_F(PartialTest, DuplicateKeysReplaceOnce) {
    auto result = from_str<Guarded>(R"({"first": 1, "first": 5, "second": 2, "check": 4})");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(unwrap(result).first.value, 5);
    EXPECT_EQ(extra(), 2);
}

TEST_F(PartialTest, TrailingCharactersDropBuiltValue) {
    auto result = from_str<Guarded>(R"({"first": 1, "second": 2, "check": 4} [])");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TrailingCharacters);
}

TEST_F(PartialTest, FailureMidList) {
    auto result = from_str<std::vector<Tracked>>(R"([1, 2, 3, "x"])");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path_string(), "$[3]");
}

TEST_F(PartialTest, FailureMidMap) {
    auto result = from_str<std::map<std::string, Tracked>>(R"({"a": 1, "b": 2, "c": [})");
    ASSERT_TRUE(is_err(result));
}

TEST_F(PartialTest, FailureMidTuple) {
    auto result = from_str<std::pair<Tracked, Tracked>>(R"([1, true])");
    ASSERT_TRUE(is_err(result));

    auto too_long = from_str<std::pair<Tracked, Tracked>>("[1, 2, 3]");
    ASSERT_TRUE(is_err(too_long));
}

TEST_F(PartialTest, FailureInsideNestedContainers) {
    auto result = from_str<std::vector<std::optional<std::vector<Tracked>>>>(
        R"([[1, 2], null, [3, 4, {}]])");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path_string(), "$[2][2]");
}

TEST_F(PartialTest, SuccessKeepsEveryElement) {
    auto result = from_str<std::vector<Tracked>>("[1, 2]");
    ASSERT_TRUE(is_ok(result)) << error_text(result);
    EXPECT_EQ(extra(), 2);
}
