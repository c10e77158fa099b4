// Copyright 2013 Viewfinder. All rights reserved.

#include <ctype.h>
#include <stdlib.h>
#include <algorithm>
#include "Format.h"

namespace {

using std::ios_base;

struct Item {
  Item()
      : fill(' '),
        truncate(false),
        width(0),
        precision(6),
        flags(ios_base::dec) {
  }

  char fill;
  bool truncate;
  int width;
  int precision;
  ios_base::fmtflags flags;
};

const char* ParseInt(const char* start, int* value) {
  char* end;
  *value = strtol(start, &end, 10);
  return end;
}

void PutItem(ostream& os, const Item& i, const Formatter::Arg& arg) {
  const ios_base::fmtflags old_flags = os.flags();
  const char old_fill = os.fill();
  const std::streamsize old_precision = os.precision();

  if (i.truncate) {
    std::ostringstream ss;
    arg.Put(ss);
    os.fill(i.fill);
    os.width(i.width);
    os.flags(i.flags);
    os << ss.str().substr(0, i.precision);
  } else {
    os.fill(i.fill);
    os.width(i.width);
    os.precision(i.precision);
    os.flags(i.flags);
    arg.Put(os);
  }

  os.width(0);
  os.flags(old_flags);
  os.fill(old_fill);
  os.precision(old_precision);
}

// Parses the directive beginning just past the '%' at *ptr. Returns false if
// the directive is malformed.
bool ParseDirective(const char** ptr, const char* end, Item* i) {
  const char* p = *ptr;
  for (; p < end; ++p) {
    if (*p == '0') {
      i->fill = '0';
    } else if (*p == '-') {
      i->flags &= ~ios_base::adjustfield;
      i->flags |= ios_base::left;
    } else if (*p == '+') {
      i->flags |= ios_base::showpos;
    } else {
      break;
    }
  }
  if (p < end && isdigit(*p)) {
    p = ParseInt(p, &i->width);
  }
  bool parsed_precision = false;
  if (p < end && *p == '.') {
    ++p;
    i->precision = 0;
    if (p < end && isdigit(*p)) {
      p = ParseInt(p, &i->precision);
    }
    parsed_precision = true;
  }
  if (p >= end) {
    return false;
  }

  switch (*p) {
    case 'd':
    case 'i':
    case 'u':
      break;
    case 'X':
      i->flags |= ios_base::uppercase;
      // Fall through.
    case 'x':
      i->flags &= ~ios_base::basefield;
      i->flags |= ios_base::hex;
      break;
    case 'o':
      i->flags &= ~ios_base::basefield;
      i->flags |= ios_base::oct;
      break;
    case 'f':
      i->flags |= ios_base::fixed;
      break;
    case 'e':
      i->flags |= ios_base::scientific;
      break;
    case 'g':
      break;
    case 'c':
    case 's':
      i->truncate = parsed_precision;
      break;
    default:
      return false;
  }

  if (i->flags & ios_base::left) {
    // Left alignment always pads with spaces.
    i->fill = ' ';
  } else if (i->fill != ' ') {
    i->flags &= ~ios_base::adjustfield;
    i->flags |= ios_base::internal;
  }

  *ptr = p + 1;
  return true;
}

const FormatMaker kFormatMaker = {};

}  // namespace

const FormatMaker& Format = kFormatMaker;

void Formatter::Apply(
    ostream& os, const Arg* args, int args_count) const {
  const char* ptr = format_.data();
  const char* const end = ptr + format_.size();
  int cur_arg = 0;

  while (ptr < end) {
    const char* pct = std::find(ptr, end, '%');
    os.write(ptr, pct - ptr);
    if (pct == end) {
      break;
    }
    ptr = pct + 1;
    if (ptr < end && *ptr == '%') {
      os.put('%');
      ++ptr;
      continue;
    }
    Item i;
    if (!ParseDirective(&ptr, end, &i)) {
      os << "<Error: unterminated format: '" << Slice(pct, end - pct) << "'>";
      return;
    }
    if (cur_arg >= args_count) {
      os << "<Error: too few format arguments: " << args_count << ">";
      return;
    }
    PutItem(os, i, args[cur_arg++]);
  }

  if (cur_arg != args_count) {
    os << "<Error: incorrect number of format arguments: "
       << args_count << " != " << cur_arg << ">";
  }
}
