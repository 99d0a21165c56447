#pragma once

#include <zkguest/core/buf.h>
#include <zkguest/core/error.h>

namespace zkguest::guest {

// Upper bound on the bytes a guest accepts from its input channel.
constexpr int max_input_size = 64 * 1024;

class input_channel_t {
 public:
  virtual ~input_channel_t() {}
  // Blocks until end-of-input and returns everything read.
  virtual error_t read_to_end(buf_t& out) = 0;
};

// Public output of the execution. Accepts exactly one commit.
class journal_t {
 public:
  virtual ~journal_t() {}
  error_t commit_slice(mem_t data);
  bool is_committed() const { return committed; }

 protected:
  virtual error_t write(mem_t data) = 0;

 private:
  bool committed = false;
};

class fd_input_channel_t : public input_channel_t {
 public:
  explicit fd_input_channel_t(int _fd) : fd(_fd) {}
  error_t read_to_end(buf_t& out) override;

 private:
  int fd;
};

class fd_journal_t : public journal_t {
 public:
  explicit fd_journal_t(int _fd) : fd(_fd) {}

 protected:
  error_t write(mem_t data) override;

 private:
  int fd;
};

class mem_input_channel_t : public input_channel_t {
 public:
  explicit mem_input_channel_t(mem_t data) : input(data) {}
  error_t read_to_end(buf_t& out) override;
  int get_read_count() const { return read_count; }

 private:
  buf_t input;
  int read_count = 0;
};

class mem_journal_t : public journal_t {
 public:
  const buf_t& get() const { return output; }

 protected:
  error_t write(mem_t data) override;

 private:
  buf_t output;
};

}  // namespace zkguest::guest
