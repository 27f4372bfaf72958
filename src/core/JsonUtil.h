#pragma once
#include <chrono>
#include <string>

namespace secret_guard {
namespace jsonutil {

std::string escape(const std::string& s);
// ISO-8601 UTC ("2023-12-25T12:30:45Z"); empty for the epoch.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

} // namespace jsonutil
} // namespace secret_guard
