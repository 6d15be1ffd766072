/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */
#pragma once

#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <vector>
#include <plenum/utils.h>


namespace plenum {

  typedef uint64_t word_t;
  static constexpr size_t bits_per_word = sizeof(word_t) * CHAR_BIT;

  // A fixed length bitmap over 64 bit words. Bits in the tail padding of the last word are
  // never set by anything in the memory core, but they do exist, which is why find_first_clear
  // can return an index >= length() and callers must bound the result themselves.
  class Bitmap final {
   public:
    explicit Bitmap(size_t length)
        : m_length(length)
        , m_bits((length + bits_per_word - 1) / bits_per_word, 0) {}

    size_t length(void) const { return m_length; }
    size_t word_count(void) const { return m_bits.size(); }

    inline bool get(size_t n) const { return (m_bits[word_offset(n)] & bit_mask(n)) != 0; }
    inline void set(size_t n) { m_bits[word_offset(n)] |= bit_mask(n); }
    inline void clear(size_t n) { m_bits[word_offset(n)] &= ~bit_mask(n); }

    // Index of the lowest clear bit in the first word that is not full, or SIZE_MAX if every
    // word is full. The index may point into the tail padding.
    size_t find_first_clear(void) const {
      for (size_t w = 0; w < m_bits.size(); w++) {
        if (m_bits[w] != ~(word_t)0) {
          return w * bits_per_word + __builtin_ctzll(~m_bits[w]);
        }
      }
      return SIZE_MAX;
    }

    // How many of the first `limit` bits are set?
    size_t count_set(size_t limit) const {
      if (limit > m_length) limit = m_length;
      size_t count = 0;
      size_t full_words = limit / bits_per_word;
      for (size_t w = 0; w < full_words; w++) {
        count += __builtin_popcountll(m_bits[w]);
      }
      size_t rem = limit % bits_per_word;
      if (rem != 0) {
        count += __builtin_popcountll(m_bits[full_words] & ((word_t(1) << rem) - 1));
      }
      return count;
    }

   private:
    static inline size_t word_offset(size_t n) { return n / bits_per_word; }
    static inline word_t bit_mask(size_t n) { return word_t(1) << (n % bits_per_word); }

    size_t m_length;
    std::vector<word_t> m_bits;
  };
}  // namespace plenum
