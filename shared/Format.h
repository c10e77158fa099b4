// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_FORMAT_H
#define PHONELIB_FORMAT_H

#include <iostream>
#include <sstream>
#include <string>
#include "Utils.h"

// A printf-style formatter that outputs its arguments through their
// ostream operators. Supported directives: %d %i %u %x %X %o %f %e %g %c %s
// and %%, with the '-', '0', '+' flags, a width and a precision. The
// precision truncates %s arguments.
//
//   string s = Format("%s has %d digits", number, 11);
class Formatter {
 public:
  // A single argument to the formatter. Stores a pointer to the argument and
  // outputs it through its ostream operator.
  class Arg {
    typedef void (*PutType)(ostream& os, const void* val);

    template <typename T>
    struct Helper {
      static void Put(ostream& os, const void* val) {
        os << *static_cast<const T*>(val);
      }
    };

   public:
    template <typename T>
    Arg(const T& v)
        : val_(&v),
          put_(&Helper<T>::Put) {
    }

    void Put(ostream& os) const {
      put_(os, val_);
    }

   private:
    const void* val_;
    PutType put_;
  };

 public:
  explicit Formatter(const Slice& format)
      : format_(format) {
  }

  // Applies the array of arguments to the format string, outputting the
  // result to the ostream. A mismatch between the directives and the
  // argument count is reported inline in the output.
  void Apply(ostream& os, const Arg* args, int args_count) const;

 private:
  const Slice format_;
};

struct FormatMaker {
  string operator()(const char* fmt) const {
    std::ostringstream ss;
    Formatter(fmt).Apply(ss, NULL, 0);
    return ss.str();
  }

  template <typename... Args>
  string operator()(const char* fmt, const Args&... args) const {
    const Formatter::Arg arg_list[] = { Formatter::Arg(args)... };
    std::ostringstream ss;
    Formatter(fmt).Apply(ss, arg_list, sizeof...(Args));
    return ss.str();
  }
};

extern const FormatMaker& Format;

#endif // PHONELIB_FORMAT_H
