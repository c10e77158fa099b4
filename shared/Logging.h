// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_LOGGING_H
#define PHONELIB_LOGGING_H

#include <functional>
#include "Format.h"
#include "Utils.h"
#include "WallTime.h"

const char* LogFormatFileLine(const char* file_line);

class LogStream : private std::streambuf {
  typedef Formatter::Arg Arg;

 public:
  explicit LogStream(string* output);
  ~LogStream();

  LogStream& operator<<(ostream& (*val)(ostream&)) {
    strm_ << val;
    return *this;
  }

  template <typename T>
  LogStream& operator<<(const T &val) {
    strm_ << val;
    return *this;
  }

  LogStream& operator()(const char* fmt) {
    Formatter(fmt).Apply(strm_, NULL, 0);
    return *this;
  }

  template <typename... Args>
  LogStream& operator()(const char* fmt, const Args&... args) {
    const Arg arg_list[] = { Arg(args)... };
    Formatter(fmt).Apply(strm_, arg_list, sizeof...(Args));
    return *this;
  }

 private:
  int sync();
  int overflow(int c);

 private:
  ostream strm_;
  string* const output_;
  char buf_[256];
};

class LogStreamVoidify {
 public:
  LogStreamVoidify() { }
  void operator&(LogStream&) { }
};

struct LogArgs {
  LogArgs(const char* file_line, bool v);

  string message;
  const char* const file_line;
  const double timestamp;
  const int pid;
  const int tid;
  const bool vlog;
};

typedef std::function<void (const LogArgs&)> LogSink;

class LogMessage {
  struct Helper {
    Helper(bool d, bool v, const char* file_line)
        : die(d),
          args(file_line, v) {
    }
    ~Helper();

    const bool die;
    LogArgs args;
  };

 public:
  LogMessage(const char* file_line, bool die, bool vlog);
  ~LogMessage();

  LogStream& stream() { return stream_; }

 private:
  Helper helper_;
  LogStream stream_;
};

class Logging {
 public:
  // Adds a sink that receives every log message. Returns an id that can be
  // passed to RemoveLogSink().
  static int AddLogSink(const LogSink& sink);
  static void RemoveLogSink(int id);
  // Controls whether VLOG messages are written to stderr. They are always
  // delivered to the other sinks.
  static void SetVerboseStderr(bool verbose);
};

// Captures all log output (including VLOG) for the lifetime of the object
// and suppresses the other sinks. Used by tests to verify diagnostics.
class ScopedLogSink {
  struct Impl;

 public:
  ScopedLogSink();
  ~ScopedLogSink();

  string output() const;

 private:
  Impl* impl_;
};

#define LOG_FILE_LINE3(x)  #x
#define LOG_FILE_LINE2(x)  LOG_FILE_LINE3(x)
#define LOG_FILE_LINE      __FILE__ ":" LOG_FILE_LINE2(__LINE__) ":"

#define LOG \
  LogMessage(LOG_FILE_LINE, false, false).stream()
// VLOG messages reach every sink but are only written to stderr after
// Logging::SetVerboseStderr(true).
#define VLOG \
  LogMessage(LOG_FILE_LINE, false, true).stream()
#define DIE \
  LogMessage(LOG_FILE_LINE, true, false).stream()
#define CHECK(cond)                               \
  (cond) ? (void) 0 :                             \
  LogStreamVoidify() &                            \
  LogMessage(LOG_FILE_LINE, true, false).stream() \
  << "check failed: " << #cond

#ifdef DEBUG
#define DCHECK(cond) CHECK(cond)
#else
#define DCHECK(cond)                               \
  (cond) ? (void) 0 :                              \
  LogStreamVoidify() &                             \
  LogMessage(LOG_FILE_LINE, false, false).stream() \
  << "dcheck failed: " << #cond
#endif

// Passes values through by reference. Comparison macros take their operands
// through here so each operand is evaluated exactly once.
template <class T>
inline const T& GetReferenceableValue(const T& t) { return t; }

// Check<op>Impl() returns NULL if the comparison holds and otherwise a newly
// allocated description of the failure which the caller must delete. The
// (int, int) overload lets values of anonymous enum types be compared.
#define DEFINE_CHECK_OP_IMPL(name, op)                                  \
  template <class T1, class T2>                                         \
  inline string* Check##name##Impl(const T1& v1, const T2& v2,          \
                                   const char* names) {                 \
    if (v1 op v2) return NULL;                                          \
    else return new string(Format("%s (%s vs %s)", names, v1, v2));     \
  }                                                                     \
  inline string* Check##name##Impl(int v1, int v2, const char* names) { \
    return Check##name##Impl<int, int>(v1, v2, names);                  \
  }

DEFINE_CHECK_OP_IMPL(_EQ, ==)
DEFINE_CHECK_OP_IMPL(_NE, !=)
DEFINE_CHECK_OP_IMPL(_LE, <=)
DEFINE_CHECK_OP_IMPL(_LT, < )
DEFINE_CHECK_OP_IMPL(_GE, >=)
DEFINE_CHECK_OP_IMPL(_GT, > )
#undef DEFINE_CHECK_OP_IMPL

// Runs the body at most once, with '_result' holding the failure
// description, and frees the description afterwards.
#define LOG_CHECK_OP(name, op, val1, val2, die, what)            \
  for (string* _result =                                         \
           Check##name##Impl(                                    \
               GetReferenceableValue(val1),                      \
               GetReferenceableValue(val2),                      \
               #val1 " " #op " " #val2);                         \
       _result != NULL;                                          \
       delete _result, _result = NULL)                           \
    LogMessage(LOG_FILE_LINE, die, false).stream()               \
        << what " failed: " << *_result

// Dies with both values in the message if the comparison fails. Extra
// context can be streamed onto the failure:
//   CHECK_LT(pos, chars.size()) << ": " << text;
#define CHECK_OP(name, op, val1, val2)                  \
  LOG_CHECK_OP(name, op, val1, val2, true, "check")
#define CHECK_EQ(val1, val2) CHECK_OP(_EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(_NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(_LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(_LT, < , val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(_GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(_GT, > , val1, val2)

// Like DCHECK(), a failed DCHECK_* only logs in non-DEBUG builds.
#ifdef DEBUG
#define DCHECK_OP(name, op, val1, val2) CHECK_OP(name, op, val1, val2)
#else
#define DCHECK_OP(name, op, val1, val2)                 \
  LOG_CHECK_OP(name, op, val1, val2, false, "dcheck")
#endif
#define DCHECK_EQ(val1, val2) DCHECK_OP(_EQ, ==, val1, val2)
#define DCHECK_NE(val1, val2) DCHECK_OP(_NE, !=, val1, val2)
#define DCHECK_LE(val1, val2) DCHECK_OP(_LE, <=, val1, val2)
#define DCHECK_LT(val1, val2) DCHECK_OP(_LT, < , val1, val2)
#define DCHECK_GE(val1, val2) DCHECK_OP(_GE, >=, val1, val2)
#define DCHECK_GT(val1, val2) DCHECK_OP(_GT, > , val1, val2)

#endif // PHONELIB_LOGGING_H
