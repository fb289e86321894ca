#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace quicgate {

// ============================================================================
// HTTP helpers
// ============================================================================

// RFC 1123 date in GMT, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string format_http_date(std::time_t when);

// Current time as an RFC 1123 date.
std::string http_date_now();

std::string_view trim(std::string_view s);

// "chat, superchat" -> {"chat", "superchat"}; empty items are dropped.
std::vector<std::string> split_comma_list(std::string_view value);

// ============================================================================
// UTF-8 validation (text frames must carry valid UTF-8)
// ============================================================================

bool is_valid_utf8(std::string_view data);

}  // namespace quicgate
