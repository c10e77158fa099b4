// Copyright 2012 Viewfinder. All rights reserved.

#ifdef TESTING

#include "Testing.h"
#include "WallTime.h"

namespace {

// Allocated on first registration, which happens during static
// initialization of the test files.
vector<const TestInfo*>* registered_tests;

bool MatchesFilter(const TestInfo& info, const Slice& filter) {
  if (filter.empty()) {
    return true;
  }
  const string full_name = Format("%s.%s", info.test_case, info.name);
  return full_name.find(filter.data(), 0, filter.size()) != string::npos;
}

}  // namespace

const TestInfo* Testing::current_info;
int Testing::current_failures;

Test::Test() {
}

Test::~Test() {
}

void Test::SetUp() {
}

void Test::TearDown() {
}

void Test::Run() {
  SetUp();
  TestBody();
  TearDown();
}

const TestInfo* Testing::RegisterTest(
    const char* test_case, const char* name, const TestFactory& factory) {
  if (!registered_tests) {
    registered_tests = new vector<const TestInfo*>;
  }
  TestInfo* info = new TestInfo;
  info->test_case = test_case;
  info->name = name;
  info->factory = factory;
  registered_tests->push_back(info);
  return info;
}

int Testing::RunTests(const Slice& filter) {
  if (!registered_tests) {
    LOG("testing: no tests registered");
    return 0;
  }
  int run = 0;
  int failed = 0;
  const WallTime start_all = WallTime_Now();
  for (int i = 0; i < registered_tests->size(); ++i) {
    const TestInfo* info = (*registered_tests)[i];
    if (!MatchesFilter(*info, filter)) {
      continue;
    }
    current_info = info;
    current_failures = 0;
    const WallTime start = WallTime_Now();
    std::unique_ptr<Test> test(info->factory());
    test->Run();
    ++run;
    if (current_failures > 0) {
      ++failed;
      LOG("testing: %s.%s FAILED (%d failures, %.1f ms)",
          info->test_case, info->name, current_failures,
          (WallTime_Now() - start) * 1000);
    } else {
      VLOG("testing: %s.%s passed (%.1f ms)",
           info->test_case, info->name, (WallTime_Now() - start) * 1000);
    }
  }
  current_info = NULL;
  LOG("testing: %d of %d tests passed (%.3f sec)",
      run - failed, run, WallTime_Now() - start_all);
  return failed;
}

// Usage: phonelib_tests [-v] [FILTER]
int main(int argc, char* argv[]) {
  int i = 1;
  if (i < argc && Slice(argv[i]) == "-v") {
    Logging::SetVerboseStderr(true);
    ++i;
  }
  const Slice filter = i < argc ? argv[i] : "";
  return Testing::RunTests(filter) == 0 ? 0 : 1;
}

#endif  // TESTING
