/*
 * HTTPScript dynamic value generators
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Native implementation behind $uuid, $timestamp, $isoTimestamp and
 *   $random.*. Shared by the script bindings and the static (dry-run)
 *   resolver. Invalid ranges throw std::invalid_argument.
 */
#pragma once
#include <cstdint>
#include <string>

namespace httpscript::generators {

std::string uuid();                 // RFC 4122 v4, lower case
std::string email();                // 12 alnum @ 6 alnum . 2 letters
std::int64_t timestamp();           // seconds since epoch
std::string iso_timestamp();        // RFC 3339, local time with offset

std::int64_t integer();                               // any 32-bit value
std::int64_t integer(std::int64_t max);               // [0, max)
std::int64_t integer(std::int64_t min, std::int64_t max); // [min, max)
double real();                                        // [0, 1)
double real(double max);
double real(double min, double max);

std::string alphabetic(std::size_t length);
std::string alphanumeric(std::size_t length);
std::string hexadecimal(std::size_t length); // upper case

// True when `value` is finite and converts to int64_t without overflow.
bool fits_integer(double value);

// JavaScript-like rendering of a double (no trailing zeros, integral values without ".0").
std::string format_number(double value);

} // namespace httpscript::generators
