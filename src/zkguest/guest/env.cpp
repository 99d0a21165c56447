#include "env.h"

namespace zkguest::guest {

error_t journal_t::commit_slice(mem_t data) {
  if (committed) return error(E_CHANNEL_CLOSED, "journal already committed");
  error_t rv = UNINITIALIZED_ERROR;
  if ((rv = write(data))) return rv;
  committed = true;
  return SUCCESS;
}

error_t fd_input_channel_t::read_to_end(buf_t& out) {
  buf_t result;
  byte_t chunk[4096];
  for (;;) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      return error(E_CHANNEL_READ, "read failed, errno=" + std::to_string(errno));
    }
    if (n == 0) break;
    if (result.size() + n > max_input_size) return error(E_RANGE, "input exceeds max_input_size");
    result += mem_t(chunk, int(n));
  }
  secure_bzero(chunk, sizeof(chunk));

  out = std::move(result);
  return SUCCESS;
}

error_t fd_journal_t::write(mem_t data) {
  int offset = 0;
  while (offset < data.size) {
    ssize_t n = ::write(fd, data.data + offset, data.size - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      return error(E_CHANNEL_WRITE, "write failed, errno=" + std::to_string(errno));
    }
    offset += int(n);
  }
  return SUCCESS;
}

error_t mem_input_channel_t::read_to_end(buf_t& out) {
  if (read_count++) return error(E_CHANNEL_READ, "input already consumed");
  if (input.size() > max_input_size) return error(E_RANGE, "input exceeds max_input_size");
  out = std::move(input);
  return SUCCESS;
}

error_t mem_journal_t::write(mem_t data) {
  output += data;
  return SUCCESS;
}

}  // namespace zkguest::guest
