#pragma once

#include <zkguest/guest/config.h>
#include <zkguest/guest/env.h>
#include <zkguest/guest/predicate.h>

namespace zkguest::guest {

enum class outcome_e {
  success,
  abort,
};

/**
 * Reads the input channel to the end, decodes one uint256, evaluates the predicate and on a
 * match commits the re-encoded value to the journal exactly once.
 *
 * @notes:
 * - Every failure, whether a decode fault, a predicate mismatch or a channel error, is reported
 *   as the same outcome_e::abort. Unless log_faults is set, the run is also silent.
 * - An object runs at most once; a second execute() aborts without touching the channels.
 */
class predicate_guest_t {
 public:
  enum class state_e {
    start,
    decoding,
    matching,
    committing,
    success,
    abort,
  };

  predicate_guest_t(const predicate_t& _predicate, sol::decode_mode_e _decode_mode, bool _log_faults = false)
      : predicate(_predicate), decode_mode(_decode_mode), log_faults(_log_faults) {}

  outcome_e execute(input_channel_t& input, journal_t& journal);
  state_e state() const { return current; }
  // State the run was in when it aborted; start if it has not aborted.
  state_e aborted_in() const { return abort_state; }

 private:
  error_t run(input_channel_t& input, journal_t& journal);

  const predicate_t& predicate;
  sol::decode_mode_e decode_mode;
  bool log_faults;
  state_e current = state_e::start;
  state_e abort_state = state_e::start;
};

outcome_e run_predicate_guest(const guest_config_t& config, input_channel_t& input, journal_t& journal);

// Terminates the process abnormally. The only failure signal a host observes.
[[noreturn]] void guest_abort();

// Guest entry point over file descriptors. Returns 0 on success and does not return otherwise.
int guest_main(const guest_config_t& config, int in_fd, int out_fd);

}  // namespace zkguest::guest
