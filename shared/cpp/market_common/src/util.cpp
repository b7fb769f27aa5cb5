#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <iomanip>

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

int getenv_int(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw ValidationError(std::string("invalid integer in ") + key + ": " + v);
    }
}

double getenv_double(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stod(v);
    } catch (const std::exception&) {
        throw ValidationError(std::string("invalid number in ") + key + ": " + v);
    }
}

static std::string to_hex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::hex << std::nouppercase << ((data[i] >> 4) & 0xF) << (data[i] & 0xF);
    }
    return oss.str();
}

std::string gen_id() {
    unsigned char buf[16];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buf, sizeof(buf));
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    return to_hex(md, SHA256_DIGEST_LENGTH);
}

std::string format_timestamp(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    int millis = static_cast<int>(epoch_ms % 1000);
    if (millis < 0) { millis += 1000; --secs; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::ostringstream oss;
    oss << buf << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}
