#ifndef GROVE_UTILS_H_
#define GROVE_UTILS_H_

#include <string>
#include <filesystem>
#include <string_view>

#include <grove/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm600 = fs::perms::owner_read | fs::perms::owner_write;
constexpr fs::perms kPerm700 = fs::perms::owner_all;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// create or truncate
bool WriteFile(const fs::path&, std::string_view content, fs::perms = fs::perms::unknown);
bool ReadFile(const fs::path&, std::string& content);

// async-signal-safe; for use between fork and exec
int CloseFrom(int minfd);
// pipe2 with both ends moved to descriptors >= kPipeFdBase, close-on-exec
constexpr int kPipeFdBase = 10;
bool MakePipe(int fds[2]);
bool SetNonBlocking(int fd);
void CloseFd(int& fd);
// retries on EINTR and short writes; false on any other error
bool WriteAll(int fd, std::string_view data);

#endif  // GROVE_UTILS_H_
