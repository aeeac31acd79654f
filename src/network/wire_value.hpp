#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace polykv {

// ── Wire values ───────────────────────────────────────────────────────────────
//
// Parsed representation of one RESP message element, before any
// command-specific interpretation.  Produced by the RESP reader, consumed
// read-only by the command translator.

struct SimpleString {
    std::string data;   // +data\r\n
};

struct ErrorString {
    std::string message; // -message\r\n
};

struct BulkString {
    std::string data;   // $len\r\ndata\r\n (binary safe)
};

struct Integer {
    std::int64_t value; // :value\r\n
};

struct NullArray {};      // *-1\r\n
struct NullBulkString {}; // $-1\r\n

struct WireArray;

using WireValue = std::variant<SimpleString, ErrorString, BulkString, Integer,
                               WireArray, NullArray, NullBulkString>;

struct WireArray {
    std::vector<WireValue> elements; // *N\r\n followed by N values
};

// Builds an array of bulk strings, the shape every client request takes.
[[nodiscard]] inline WireValue make_bulk_array(const std::vector<std::string>& parts) {
    WireArray array;
    array.elements.reserve(parts.size());
    for (const auto& p : parts) {
        array.elements.emplace_back(BulkString{p});
    }
    return array;
}

} // namespace polykv
