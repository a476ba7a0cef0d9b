#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <sys/types.h>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <grove/config.h>

namespace fs = std::filesystem;

// removed by the test environment on teardown
extern fs::path kTestRoot;

// Degraded mode with /bin/sh as the interpreter and a fresh scratch root named after the test
Config TestConfig();

size_t CountEntries(const fs::path& dir);

// A plain directory holding the control and event files of an idle cgroup v2 leaf
fs::path MakeFakeCgroup(const fs::path& dir);

// false for zombies and missing processes
bool ProcessAlive(pid_t pid);

// Polls cond every 10ms
bool WaitUntil(const std::function<bool()>& cond, int timeout_ms);

#endif // TEST_UTILS_H_
