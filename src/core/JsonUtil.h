#pragma once
#include <string>

namespace revkit {
namespace jsonutil {

// JSON string escaping; bytes >= 0x20 (including UTF-8 sequences) pass through.
std::string escape(const std::string& s);

// Fixed-point rendering with trailing zeros trimmed ("92.5", "100.0").
std::string format_decimal(double value, int precision = 2);

}
}
