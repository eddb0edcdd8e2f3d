// Precompiled header (PCH)
// Only stable standard library and third-party headers belong here.
// Project headers stay out (they change often and would force PCH rebuilds).
#pragma once

// Windows: disable min/max macros so std::min/std::max keep working
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

// ==================== C++ standard library ====================

// Containers
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <array>
#include <unordered_map>
#include <deque>

// Utilities
#include <functional>
#include <optional>
#include <variant>
#include <memory>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <thread>
#include <tuple>

// IO / formatting
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

// Misc
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <ctime>
#include <algorithm>
#include <numeric>
#include <bit>
#include <utility>
#include <cctype>
#include <arpa/inet.h>
#include <exception>
#include <stdexcept>
#include <random>
#include <regex>
#include <future>

// ==================== Drogon / Trantor ====================

#include <drogon/drogon.h>
#include <drogon/HttpController.h>
#include <drogon/HttpAppFramework.h>
#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <drogon/nosql/RedisClient.h>
#include <drogon/utils/Utilities.h>
#include <drogon/utils/coroutine.h>

#include <trantor/net/TcpClient.h>
#include <trantor/net/Resolver.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Logger.h>

// ==================== Third-party ====================

#include <json/json.h>
