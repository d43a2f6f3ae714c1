#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <functional>
#include <memory>
#include <type_traits>

#include <cstdint>
#include <cstring>
#include <cassert>
#include <cstdlib>

namespace champ::detail {

// ---------------------------------------------------------------------------------- Base Functions

using hash_type = uint32_t;

constexpr uint32_t HashCodeLength{32};     // bits of hash consumed by the trie
constexpr uint32_t BitPartitionSize{5};    // bits per level
constexpr uint32_t BitPartitionMask{0x1fu};
constexpr std::size_t MaxTrieDepth{7};     // ceil(32 / 5) bitmap levels

constexpr uint8_t branch_free_popcount(uint32_t x) {
  x = x - ((x >> 1) & 0x55555555u);
  x = (x & 0x33333333u) + ((x >> 2) & 0x33333333u);
  return static_cast<uint8_t>((((x + (x >> 4)) & 0x0f0f0f0fu) * 0x01010101u) >> 24);
}

/**
 * @return The number of bits in 'x' with value 1
 */
constexpr uint8_t popcount(uint32_t x) {
#if __has_builtin(__builtin_popcount)
  return __builtin_popcount(x); // some versions of gcc/clang only
#else
  return branch_free_popcount(x);
#endif
}

/**
 * The slot of the lowest set bit of a non-empty `bitmap`
 */
constexpr uint32_t lowest_slot(uint32_t bitmap) {
  assert(bitmap != 0);
  return static_cast<uint32_t>(std::countr_zero(bitmap));
}

/**
 * The 5-bit partition of `hash` selected by `shift`
 */
constexpr uint32_t mask(hash_type hash, uint32_t shift) {
  assert(shift < HashCodeLength);
  return (hash >> shift) & BitPartitionMask;
}

constexpr uint32_t bitpos(uint32_t mask) { return 1u << mask; }

/**
 * Position of `bitpos` amongst the set bits of `bitmap`
 */
constexpr uint32_t index(uint32_t bitmap, uint32_t bitpos) {
  return popcount(bitmap & (bitpos - 1)); // bitpos=0x10  ==>  counts bits 0..3
}

constexpr std::size_t align_up(std::size_t offset, std::size_t align) {
  return (offset + align - 1) / align * align;
}

/**
 * The bytes between successive objects in an array of T
 */
constexpr std::size_t calculate_logical_size_(std::size_t align, std::size_t size) {
  if (size <= align)
    return align;
  if (align <= 1)
    return size;
  const auto remainder = size % align;
  const auto chunks = size / align;
  return (remainder == 0) ? size : align * (chunks + 1);
}

template <typename T> constexpr std::size_t calculate_logical_size() {
  return calculate_logical_size_(alignof(T), sizeof(T));
}

// -------------------------------------------------------------------------------------- Edit Token

using edit_type = uint64_t;

constexpr edit_type NoEdit{0};

/**
 * A fresh token, never handed out before during the life of the process.
 * Tokens are counted rather than taken from addresses, because an address
 * can be reused by a later builder.
 */
inline edit_type make_edit_token() {
  static std::atomic<edit_type> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

constexpr bool is_allowed_to_edit(edit_type node_edit, edit_type edit) {
  return node_edit != NoEdit && node_edit == edit;
}

// ---------------------------------------------------------------------------------- Change Signals

struct ChangeEvent {
  bool is_modified{false};
};

struct BulkChangeEvent {
  std::ptrdiff_t size_change{0};
  hash_type hash_change{0}; // wraps, like the aggregate hash code

  void record_duplicate(hash_type hash) {
    --size_change;
    hash_change -= hash;
  }
};

enum class SizeClass : int { Empty = 0, One = 1, MoreThanOne = 2 };

// ---------------------------------------------------------------------------------------- NodeType

enum class NodeType : int { Bitmap = 0, Collision = 1 };

// ---------------------------------------------------------------------------------------- NodeData

template <bool IsThreadSafe = true> struct NodeData {
  using ref_count_type = uint32_t;
  using counter_type =
      std::conditional_t<IsThreadSafe, std::atomic<ref_count_type>, ref_count_type>;

  static constexpr ref_count_type HighBitOffset{sizeof(ref_count_type) * 8 - 1}; // 31
  static constexpr ref_count_type HighBit{static_cast<ref_count_type>(1) << HighBitOffset};
  static constexpr ref_count_type HighMask{HighBit};
  static constexpr ref_count_type RefMask{HighBit - 1};
  static constexpr ref_count_type MaxRef{HighBit - 1};

  // @{ members
  mutable counter_type ref_count_; // The high bit is fixed at contruction
  edit_type edit_;                 // NoEdit once frozen
  // @}

  constexpr NodeData(NodeType type, edit_type edit)
      : ref_count_{HighBit * static_cast<ref_count_type>(type) + 1}, edit_{edit} {}

  constexpr ref_count_type add_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_add(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_++ & RefMask;
    }
    assert(previous_count < MaxRef);
    return previous_count + 1;
  }

  constexpr ref_count_type dec_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_sub(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_-- & RefMask;
    }
    assert(previous_count > 0);
    return previous_count - 1;
  }

  constexpr ref_count_type ref_count() const { return load_() & RefMask; }

  constexpr NodeType type() const { return static_cast<NodeType>(load_() >> HighBitOffset); }

  constexpr edit_type edit() const { return edit_; }

private:
  constexpr ref_count_type load_() const {
    if constexpr (IsThreadSafe) {
      return ref_count_.load(std::memory_order_acquire);
    } else {
      return ref_count_;
    }
  }
};

/**
 * Header of a BitmapIndexedNode. The inline keys follow the header (ascending slot order),
 * then the sub-node pointers (ascending slot order).
 */
template <bool IsThreadSafe = true> struct BitmapNodeData : public NodeData<IsThreadSafe> {
  uint32_t node_map_;
  uint32_t data_map_;

  constexpr BitmapNodeData(edit_type edit, uint32_t node_map, uint32_t data_map)
      : NodeData<IsThreadSafe>{NodeType::Bitmap, edit}, node_map_{node_map}, data_map_{data_map} {
    assert((node_map & data_map) == 0);
  }
};

/**
 * Header of a HashCollisionNode. `size_` keys follow the header, with room for `capacity_`.
 */
template <bool IsThreadSafe = true> struct CollisionNodeData : public NodeData<IsThreadSafe> {
  hash_type hash_;
  uint32_t size_;
  uint32_t capacity_;

  constexpr CollisionNodeData(edit_type edit, hash_type hash, uint32_t size, uint32_t capacity)
      : NodeData<IsThreadSafe>{NodeType::Collision, edit}, hash_{hash}, size_{size},
        capacity_{capacity} {
    assert(size <= capacity);
  }
};

} // namespace champ::detail
