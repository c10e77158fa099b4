// Copyright 2013 Viewfinder. All rights reserved.

#include <sys/time.h>
#include "Format.h"
#include "WallTime.h"

namespace {

void PrintOne(ostream& os, const struct tm& t, const string& fmt,
              int begin, int end) {
  if (begin >= end) {
    return;
  }
  char buf[128];
  const string sub = fmt.substr(begin, end - begin);
  const size_t n = strftime(buf, sizeof(buf), sub.c_str(), &t);
  os.write(buf, n);
}

}  // namespace

WallTime WallTime_Now() {
  struct timeval t;
  gettimeofday(&t, NULL);
  return t.tv_sec + (t.tv_usec / 1e6);
}

void WallTimeFormat::Print(ostream& os) const {
  const time_t time_sec = static_cast<time_t>(time_);
  struct tm t;
  if (localtime_) {
    localtime_r(&time_sec, &t);
  } else {
    gmtime_r(&time_sec, &t);
  }

  int last = 0;
  for (int i = 0; i < fmt_.size(); ) {
    const size_t p = fmt_.find('%', i);
    if (p == fmt_.npos) {
      break;
    }
    if (p + 1 < fmt_.size() &&
        (fmt_[p + 1] == 'Q' || fmt_[p + 1] == 'N')) {
      PrintOne(os, t, fmt_, last, p);
      if (fmt_[p + 1] == 'Q') {
        os << Format("%03d", static_cast<int>(1e3 * (time_ - time_sec)));
      } else {
        os << Format("%06d", static_cast<int>(1e6 * (time_ - time_sec)));
      }
      i = p + 2;
      last = i;
      continue;
    }
    i = p + 1;
  }

  PrintOne(os, t, fmt_, last, fmt_.size());
}
