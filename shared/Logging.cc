// Copyright 2013 Viewfinder. All rights reserved.

#include <algorithm>
#include <map>
#include <mutex>
#include <stdlib.h>
#include <string.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#include "Logging.h"

namespace {

typedef std::map<int, LogSink> SinkMap;

struct LogState {
  LogState()
      : next_id(1),
        verbose_stderr(false) {
  }

  std::mutex mu;
  SinkMap sinks;
  int next_id;
  bool verbose_stderr;
};

void StderrOutput(const LogArgs& args, bool verbose) {
  if (args.vlog && !verbose) {
    return;
  }

  std::cerr << WallTimeFormat("%F %T:%Q", args.timestamp)
            << " [" << args.pid << ":" << args.tid << "]"
            << " " << args.file_line << " ";

  const char* ptr = args.message.data();
  const char* end = ptr + args.message.size();
  bool prefix = false;

  while (ptr < end) {
    if (prefix) {
      prefix = false;
      std::cerr.write("    ", 4);
    }

    const char* lf = std::find(ptr, end, '\n');
    if (lf != end) {
      prefix = true;
      lf += 1;
    }

    std::cerr.write(ptr, lf - ptr);
    ptr = lf;
  }
}

LogState* NewLogState() {
  LogState* state = new LogState;
  state->sinks[0] = [state](const LogArgs& args) {
    StderrOutput(args, state->verbose_stderr);
  };
  return state;
}

LogState* state() {
  static LogState* s = NewLogState();
  return s;
}

}  // namespace

const char* LogFormatFileLine(const char* file) {
  if (!file) {
    return NULL;
  }
  const char* p = strrchr(file, '/');
  if (p) file = p + 1;
  return file;
}

LogStream::LogStream(string* output)
    : strm_(this),
      output_(output) {
  setp(&buf_[0], &buf_[sizeof(buf_) - 1]);
}

LogStream::~LogStream() {
  sync();
  if (output_->empty() || *output_->rbegin() != '\n') {
    output_->append("\n", 1);
  }
}

int LogStream::sync() {
  const int num = pptr() - pbase();
  if (num > 0) {
    output_->append(buf_, num);
    pbump(-num);
  }
  return 0;
}

int LogStream::overflow(int c) {
  if (c != EOF) {
    *pptr() = c;
    pbump(1);
    sync();
  }
  return c;
}

LogArgs::LogArgs(const char* fl, bool v)
    : file_line(LogFormatFileLine(fl)),
      timestamp(WallTime_Now()),
      pid(getpid()),
      tid(syscall(SYS_gettid)),
      vlog(v) {
}

LogMessage::Helper::~Helper() {
  LogState* s = state();
  {
    std::lock_guard<std::mutex> l(s->mu);
    for (SinkMap::iterator iter(s->sinks.begin());
         iter != s->sinks.end();
         ++iter) {
      iter->second(args);
    }
  }
  if (die) {
    abort();
  }
}

LogMessage::LogMessage(
    const char* file_line, bool die, bool vlog)
    : helper_(die, vlog, file_line),
      stream_(&helper_.args.message) {
}

LogMessage::~LogMessage() {
  if (helper_.die) {
    stream_ << "\n";
  }
}

int Logging::AddLogSink(const LogSink& sink) {
  LogState* s = state();
  std::lock_guard<std::mutex> l(s->mu);
  const int id = s->next_id++;
  s->sinks[id] = sink;
  return id;
}

void Logging::RemoveLogSink(int id) {
  LogState* s = state();
  std::lock_guard<std::mutex> l(s->mu);
  s->sinks.erase(id);
}

void Logging::SetVerboseStderr(bool verbose) {
  LogState* s = state();
  std::lock_guard<std::mutex> l(s->mu);
  s->verbose_stderr = verbose;
}

struct ScopedLogSink::Impl {
  SinkMap old_sinks;
  string output;
};

ScopedLogSink::ScopedLogSink()
    : impl_(new Impl) {
  LogState* s = state();
  std::lock_guard<std::mutex> l(s->mu);
  s->sinks.swap(impl_->old_sinks);
  Impl* impl = impl_;
  s->sinks[0] = [impl](const LogArgs& args) {
    impl->output += Format("%s %s",
                           args.file_line ? args.file_line : "",
                           args.message);
  };
}

ScopedLogSink::~ScopedLogSink() {
  {
    LogState* s = state();
    std::lock_guard<std::mutex> l(s->mu);
    s->sinks.swap(impl_->old_sinks);
  }
  delete impl_;
}

string ScopedLogSink::output() const {
  std::lock_guard<std::mutex> l(state()->mu);
  return impl_->output;
}
