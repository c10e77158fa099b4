// Copyright 2013 Viewfinder. All rights reserved.
//
// Command line access to the phone number library:
//
//   phonelib [--country=XX] [--format=STYLE] [--redact=N] [-v] COMMAND ARG...
//
// Each ARG is processed independently and one result line is printed per
// ARG.

#include <stdlib.h>
#include <string.h>
#include "Logging.h"
#include "PhoneFormat.h"
#include "PhoneNumber.h"
#include "PhoneNumberType.h"
#include "PhoneTextScanner.h"
#include "PhoneUtils.h"
#include "StringUtils.h"

namespace {

const char kUsage[] =
    "usage: phonelib [--country=XX] [--format=e164|international|national|"
    "rfc3966] [--redact=N] [-v] COMMAND ARG...\n"
    "commands: validate normalize country type format extract redact "
    "suggest group";

struct Options {
  Options()
      : style(PHONE_FORMAT_E164),
        visible_digits(4) {
  }

  string country;
  PhoneFormatStyle style;
  int visible_digits;
};

bool ParseFlag(const Slice& arg, Options* options) {
  Slice value(arg);
  if (arg == "-v") {
    Logging::SetVerboseStderr(true);
    return true;
  }
  if (arg.starts_with("--country=")) {
    value.remove_prefix(strlen("--country="));
    if (!FindCountryByCode(value)) {
      LOG("phonelib: unknown country: %s", value);
      return false;
    }
    options->country = value.as_string();
    return true;
  }
  if (arg.starts_with("--format=")) {
    value.remove_prefix(strlen("--format="));
    if (!ParsePhoneFormatStyle(value, &options->style)) {
      LOG("phonelib: unknown format: %s", value);
      return false;
    }
    return true;
  }
  if (arg.starts_with("--redact=")) {
    value.remove_prefix(strlen("--redact="));
    char* end = NULL;
    const string s = value.as_string();
    const long n = strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || n < 0) {
      LOG("phonelib: invalid --redact value: %s", value);
      return false;
    }
    options->visible_digits = n;
    return true;
  }
  LOG("phonelib: unknown flag: %s", arg);
  return false;
}

bool Parse(const Options& options, const string& arg, PhoneNumber* number) {
  if (options.country.empty()) {
    return PhoneNumber::Parse(arg, number);
  }
  return PhoneNumber::ParseWithCountry(arg, options.country, number);
}

string Describe(const ExtractedPhoneNumber& n) {
  return Format("%d-%d\t%s\t%s", n.start, n.end, n.raw,
                n.is_valid ? n.normalized : "invalid");
}

int RunCommand(const string& command, const Options& options,
               const vector<string>& args) {
  if (command == "group") {
    const vector<vector<string> > groups = GroupEquivalentPhoneNumbers(args);
    for (int i = 0; i < groups.size(); ++i) {
      std::cout << Join(groups[i], "\t") << "\n";
    }
    return 0;
  }

  int failures = 0;
  for (int i = 0; i < args.size(); ++i) {
    const string& arg = args[i];
    PhoneNumber number;
    if (command == "validate") {
      const bool valid = Parse(options, arg, &number);
      std::cout << (valid ? "valid" : "invalid") << "\t" << arg << "\n";
      failures += !valid;
    } else if (command == "normalize" || command == "country" ||
               command == "type" || command == "format") {
      if (!Parse(options, arg, &number)) {
        std::cout << "invalid\t" << arg << "\n";
        ++failures;
        continue;
      }
      if (command == "normalize") {
        std::cout << number.e164() << "\n";
      } else if (command == "country") {
        std::cout << number.country()->code << "\t"
                  << number.country()->name << "\t+"
                  << number.country_code() << "\n";
      } else if (command == "type") {
        std::cout << PhoneNumberTypeName(number.type()) << "\n";
      } else {
        std::cout << number.Format(options.style) << "\n";
      }
    } else if (command == "extract") {
      vector<ExtractedPhoneNumber> numbers;
      if (options.country.empty()) {
        ExtractPhoneNumbers(arg, &numbers);
      } else {
        ExtractPhoneNumbersWithCountryHint(arg, options.country, &numbers);
      }
      for (int j = 0; j < numbers.size(); ++j) {
        std::cout << Describe(numbers[j]) << "\n";
      }
    } else if (command == "redact") {
      std::cout << RedactPhoneNumbers(arg, options.visible_digits) << "\n";
    } else if (command == "suggest") {
      const vector<string> suggestions =
          SuggestPhoneNumberCorrections(arg, options.country);
      std::cout << arg << "\t" << Join(suggestions, " ") << "\n";
    } else {
      LOG("phonelib: unknown command: %s\n%s", command, kUsage);
      return 2;
    }
  }
  return failures > 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  Options options;
  int i = 1;
  for (; i < argc && argv[i][0] == '-'; ++i) {
    if (!ParseFlag(argv[i], &options)) {
      LOG("%s", kUsage);
      return 2;
    }
  }
  if (i >= argc) {
    LOG("%s", kUsage);
    return 2;
  }
  const string command = argv[i++];
  const vector<string> args(argv + i, argv + argc);
  return RunCommand(command, options, args);
}
