//! # Partial Values
//!
//! Memory for values that are still being built. A failed deserialization
//! must drop exactly the parts that were constructed, no more and no less;
//! these types keep that record.
//!
//! - `Slot` owns aligned storage for one value and drops it if initialized
//! - `StructFrame` tracks which fields of a struct have been written
//! - `ValueGuard` drops an initialized value unless released

#pragma once

#include "prism/shape/shape.hpp"

#include <cstddef>
#include <vector>

namespace prism {

/// Aligned storage for one value of `shape`.
///
/// Small values live inline; larger or over-aligned ones go to the heap.
class Slot {
public:
    explicit Slot(const Shape& shape);
    ~Slot();

    Slot(const Slot&) = delete;
    auto operator=(const Slot&) -> Slot& = delete;

    [[nodiscard]] auto get() -> void* {
        return storage_;
    }

    [[nodiscard]] auto shape() const -> const Shape& {
        return *shape_;
    }

    [[nodiscard]] auto initialized() const -> bool {
        return initialized_;
    }

    /// Records that the storage now holds a live value.
    void mark_initialized() {
        initialized_ = true;
    }

    /// Drops the value if there is one.
    void reset();

private:
    static constexpr size_t INLINE_SIZE = 64;

    const Shape* shape_;
    void* storage_;
    bool initialized_ = false;
    bool heap_ = false;
    alignas(std::max_align_t) unsigned char inline_[INLINE_SIZE];
};

/// Field initialization record for a struct being built in place.
///
/// Destroying an uncommitted frame drops exactly the fields that were
/// marked, in reverse declaration order.
class StructFrame {
public:
    StructFrame(const Shape& shape, void* base);
    ~StructFrame();

    StructFrame(const StructFrame&) = delete;
    auto operator=(const StructFrame&) -> StructFrame& = delete;

    [[nodiscard]] auto fields() const -> const std::vector<Field>& {
        return def_->fields;
    }

    [[nodiscard]] auto field_ptr(size_t index) const -> void*;
    [[nodiscard]] auto is_set(size_t index) const -> bool;

    /// Records field `index` as constructed.
    void mark(size_t index);

    /// Drops field `index` if it is set, so it can be written again.
    void unset(size_t index);

    /// Number of constructed fields.
    [[nodiscard]] auto count() const -> size_t;

    /// Transfers ownership of every field to the struct value.
    void commit() {
        committed_ = true;
    }

private:
    const StructDef* def_;
    unsigned char* base_;
    std::vector<uint64_t> bits_;
    bool committed_ = false;
};

/// Drops an initialized value on scope exit unless released.
class ValueGuard {
public:
    ValueGuard(const Shape& shape, void* value) : shape_(&shape), value_(value) {}

    ~ValueGuard() {
        if (value_ != nullptr) {
            shape_->vtable.drop(value_);
        }
    }

    ValueGuard(const ValueGuard&) = delete;
    auto operator=(const ValueGuard&) -> ValueGuard& = delete;

    void release() {
        value_ = nullptr;
    }

private:
    const Shape* shape_;
    void* value_;
};

} // namespace prism
