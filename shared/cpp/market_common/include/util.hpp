#pragma once
#include <cstdint>
#include <functional>
#include <string>

// Milliseconds since the Unix epoch. Stores take a Clock so tests can drive time.
using Clock = std::function<int64_t()>;

int64_t now_ms();

std::string getenv_or(const char* key, const std::string& def);
int getenv_int(const char* key, int def);
double getenv_double(const char* key, double def);

// 32 lowercase hex chars from the OpenSSL CSPRNG.
std::string gen_id();
std::string sha256_hex(const std::string& data);

// ISO-8601 UTC with millisecond precision, e.g. 2024-01-10T12:00:00.000Z
std::string format_timestamp(int64_t epoch_ms);
