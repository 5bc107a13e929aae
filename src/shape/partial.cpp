//! # Partial Values Implementation

#include "prism/shape/partial.hpp"

#include <bit>
#include <new>

namespace prism {

// ============================================================================
// Slot
// ============================================================================

Slot::Slot(const Shape& shape) : shape_(&shape), storage_(inline_) {
    const Layout& layout = shape.layout;
    if (layout.size > INLINE_SIZE || layout.align > alignof(std::max_align_t)) {
        storage_ = ::operator new(layout.size, std::align_val_t{layout.align});
        heap_ = true;
    }
}

Slot::~Slot() {
    reset();
    if (heap_) {
        ::operator delete(storage_, std::align_val_t{shape_->layout.align});
    }
}

void Slot::reset() {
    if (initialized_) {
        shape_->vtable.drop(storage_);
        initialized_ = false;
    }
}

// ============================================================================
// StructFrame
// ============================================================================

StructFrame::StructFrame(const Shape& shape, void* base)
    : def_(&shape.as_struct()), base_(static_cast<unsigned char*>(base)),
      bits_((shape.as_struct().fields.size() + 63) / 64, 0) {}

StructFrame::~StructFrame() {
    if (committed_) {
        return;
    }
    for (size_t i = def_->fields.size(); i-- > 0;) {
        if (is_set(i)) {
            def_->fields[i].shape().vtable.drop(field_ptr(i));
        }
    }
}

auto StructFrame::field_ptr(size_t index) const -> void* {
    return base_ + def_->fields[index].offset;
}

auto StructFrame::is_set(size_t index) const -> bool {
    return (bits_[index / 64] >> (index % 64)) & 1U;
}

void StructFrame::mark(size_t index) {
    bits_[index / 64] |= uint64_t{1} << (index % 64);
}

void StructFrame::unset(size_t index) {
    if (!is_set(index)) {
        return;
    }
    def_->fields[index].shape().vtable.drop(field_ptr(index));
    bits_[index / 64] &= ~(uint64_t{1} << (index % 64));
}

auto StructFrame::count() const -> size_t {
    size_t n = 0;
    for (uint64_t word : bits_) {
        n += static_cast<size_t>(std::popcount(word));
    }
    return n;
}

} // namespace prism
