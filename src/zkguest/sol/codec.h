#pragma once

#include <zkguest/sol/uint256.h>

namespace zkguest::sol {

// Solidity ABI encoding of static values: every value occupies one 32-byte big-endian word.
constexpr int word_size = 32;

enum class decode_mode_e {
  strict,   // the buffer must be exactly the encoding, no trailing bytes
  lenient,  // bytes after the last decoded word are ignored
};

buf_t abi_encode(const uint256_t& value);
buf_t abi_encode(uint64_t value);
buf_t abi_encode(bool value);

error_t abi_decode(mem_t bin, uint256_t& value, decode_mode_e mode = decode_mode_e::strict);
error_t abi_decode(mem_t bin, uint64_t& value, decode_mode_e mode = decode_mode_e::strict);
error_t abi_decode(mem_t bin, bool& value, decode_mode_e mode = decode_mode_e::strict);

/**
 * @notes:
 * - Narrow types must be left padded with zero bytes. A word whose padding is not zero does not
 *   round-trip and is rejected with E_FORMAT.
 */
error_t abi_decode_word(mem_t word, uint64_t& value);
error_t abi_decode_word(mem_t word, bool& value);

}  // namespace zkguest::sol
