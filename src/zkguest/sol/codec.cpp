#include "codec.h"

namespace zkguest::sol {

static error_t check_length(mem_t bin, decode_mode_e mode) {
  if (bin.size < word_size) return error(E_FORMAT, "abi: buffer too short for a word");
  if (mode == decode_mode_e::strict && bin.size != word_size)
    return error(E_FORMAT, "abi: unexpected trailing bytes");
  return SUCCESS;
}

static bool is_zero_padded(mem_t word, int value_size) {
  byte_t acc = 0;
  for (int i = 0; i < word_size - value_size; i++) acc |= word[i];
  return acc == 0;
}

buf_t abi_encode(const uint256_t& value) { return value.to_bin(); }

buf_t abi_encode(uint64_t value) { return uint256_t::make(value).to_bin(); }

buf_t abi_encode(bool value) { return uint256_t::make(value ? 1 : 0).to_bin(); }

error_t abi_decode(mem_t bin, uint256_t& value, decode_mode_e mode) {
  error_t rv = UNINITIALIZED_ERROR;
  if ((rv = check_length(bin, mode))) return rv;
  value = uint256_t::load(bin.data);
  return SUCCESS;
}

error_t abi_decode(mem_t bin, uint64_t& value, decode_mode_e mode) {
  error_t rv = UNINITIALIZED_ERROR;
  if ((rv = check_length(bin, mode))) return rv;
  return abi_decode_word(bin.take(word_size), value);
}

error_t abi_decode(mem_t bin, bool& value, decode_mode_e mode) {
  error_t rv = UNINITIALIZED_ERROR;
  if ((rv = check_length(bin, mode))) return rv;
  return abi_decode_word(bin.take(word_size), value);
}

error_t abi_decode_word(mem_t word, uint64_t& value) {
  if (word.size != word_size) return error(E_FORMAT, "abi: word must be 32 bytes");
  if (!is_zero_padded(word, 8)) return error(E_FORMAT, "abi: uint64 word has non-zero padding");
  value = be_get_8(word.data + word_size - 8);
  return SUCCESS;
}

error_t abi_decode_word(mem_t word, bool& value) {
  if (word.size != word_size) return error(E_FORMAT, "abi: word must be 32 bytes");
  if (!is_zero_padded(word, 1) || word[word_size - 1] > 1) return error(E_FORMAT, "abi: invalid bool word");
  value = word[word_size - 1] != 0;
  return SUCCESS;
}

}  // namespace zkguest::sol
