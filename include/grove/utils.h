#ifndef INCLUDE_GROVE_UTILS_H_
#define INCLUDE_GROVE_UTILS_H_

#include <string>

#include "bridge.h"

long GetUniqueSessionId();

const char* CloseReasonName(CloseReason);
const char* CloseReasonDesc(CloseReason);

// "method" (and "id") of a JSON-RPC message, for logging
std::string DescribeMessage(const std::string& msg);

#endif  // INCLUDE_GROVE_UTILS_H_
