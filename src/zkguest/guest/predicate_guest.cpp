#include "predicate_guest.h"

namespace zkguest::guest {

error_t predicate_guest_t::run(input_channel_t& input, journal_t& journal) {
  error_t rv = UNINITIALIZED_ERROR;

  buf_t bin;
  current = state_e::decoding;
  if ((rv = input.read_to_end(bin))) return rv;

  sol::uint256_t value;
  if (sol::abi_decode(bin, value, decode_mode))
    return error(E_GUEST_DECODE, "input is not an abi-encoded uint256");

  current = state_e::matching;
  if (!predicate.eval(value)) return error(E_GUEST_PREDICATE, "predicate rejected input");

  current = state_e::committing;
  buf_t out = sol::abi_encode(value);
  if ((rv = journal.commit_slice(out))) return rv;

  current = state_e::success;
  return SUCCESS;
}

outcome_e predicate_guest_t::execute(input_channel_t& input, journal_t& journal) {
  if (current != state_e::start) {
    abort_state = current;
    current = state_e::abort;
    return outcome_e::abort;
  }

  error_t rv;
  {
    dylog_disable_scope_t log_scope(log_faults);
    rv = run(input, journal);
  }
  if (rv) {
    abort_state = current;
    current = state_e::abort;
    return outcome_e::abort;
  }
  return outcome_e::success;
}

outcome_e run_predicate_guest(const guest_config_t& config, input_channel_t& input, journal_t& journal) {
  equals_predicate_t predicate(config.expected);
  predicate_guest_t guest(predicate, config.decode_mode, config.log_faults);
  return guest.execute(input, journal);
}

void guest_abort() { std::abort(); }

int guest_main(const guest_config_t& config, int in_fd, int out_fd) {
  fd_input_channel_t input(in_fd);
  fd_journal_t journal(out_fd);
  if (run_predicate_guest(config, input, journal) != outcome_e::success) guest_abort();
  return 0;
}

}  // namespace zkguest::guest
