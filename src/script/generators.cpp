/*
 * HTTPScript dynamic value generators
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <httpscript/script/generators.hpp>
#include <uuid/uuid.h>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace httpscript::generators {

static std::mt19937_64& rng() {
    static std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

static std::string pick(const std::string& charset, std::size_t length) {
    std::uniform_int_distribution<std::size_t> dist(0, charset.size() - 1);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) out.push_back(charset[dist(rng())]);
    return out;
}

static const std::string kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
static const std::string kAlnum = kLetters + "0123456789";

std::string uuid() {
    uuid_t id;
    uuid_generate_random(id);
    char buf[37];
    uuid_unparse_lower(id, buf);
    return buf;
}

std::string email() { return pick(kAlnum, 12) + "@" + pick(kAlnum, 6) + "." + pick(kLetters, 2); }

std::int64_t timestamp() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[40];
    std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%S%z", &local);
    std::string out = buf;
    // +0200 -> +02:00
    if (out.size() >= 5) out.insert(out.size() - 2, ":");
    return out;
}

bool fits_integer(double value) {
    // 2^63 is exactly representable, INT64_MAX is not
    return std::isfinite(value) && value >= -9223372036854775808.0 && value < 9223372036854775808.0;
}

std::int64_t integer() {
    std::uniform_int_distribution<std::int64_t> dist(std::numeric_limits<std::int32_t>::min(),
                                                     std::numeric_limits<std::int32_t>::max());
    return dist(rng());
}

std::int64_t integer(std::int64_t max) { return integer(0, max); }

std::int64_t integer(std::int64_t min, std::int64_t max) {
    if (min >= max) throw std::invalid_argument("empty range: min must be lower than max");
    std::uniform_int_distribution<std::int64_t> dist(min, max - 1);
    return dist(rng());
}

double real() { return real(0.0, 1.0); }
double real(double max) { return real(0.0, max); }

double real(double min, double max) {
    if (!(min < max) || !std::isfinite(min) || !std::isfinite(max))
        throw std::invalid_argument("empty range: min must be lower than max");
    std::uniform_real_distribution<double> dist(min, max);
    return dist(rng());
}

std::string alphabetic(std::size_t length) { return pick(kLetters, length); }
std::string alphanumeric(std::size_t length) { return pick(kAlnum, length); }
std::string hexadecimal(std::size_t length) { return pick("0123456789ABCDEF", length); }

std::string format_number(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        std::ostringstream os;
        os << static_cast<long long>(value);
        return os.str();
    }
    std::ostringstream os;
    os << std::setprecision(17) << value;
    std::string shortest = os.str();
    for (int p = 1; p <= 17; ++p) { // shortest representation that round-trips
        std::ostringstream t;
        t << std::setprecision(p) << value;
        if (std::stod(t.str()) == value) { shortest = t.str(); break; }
    }
    return shortest;
}

} // namespace httpscript::generators
