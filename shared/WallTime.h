// Copyright 2013 Viewfinder. All rights reserved.

#ifndef PHONELIB_WALLTIME_H
#define PHONELIB_WALLTIME_H

#include <iostream>
#include <time.h>
#include "Utils.h"

typedef double WallTime;

WallTime WallTime_Now();

class WallTimeFormat {
 public:
  // Like strftime() format, but also accepts %Q for milliseconds and %N for
  // microseconds.
  WallTimeFormat(const string& fmt, WallTime time, bool localtime = true)
      : fmt_(fmt),
        time_(time),
        localtime_(localtime) {
  }

  void Print(ostream& os) const;

 private:
  string fmt_;
  const WallTime time_;
  const bool localtime_;
};

inline ostream& operator<<(
    ostream& os, const WallTimeFormat& f) {
  f.Print(os);
  return os;
}

#endif // PHONELIB_WALLTIME_H
