#pragma once

#include <chrono>
#include <optional>
#include <string>

std::optional<int> parse_int(const std::string& s);
double seconds_since(std::chrono::steady_clock::time_point start);
