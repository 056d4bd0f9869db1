#pragma once
#include <cstdint>
#include <string>

namespace pcex {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// "localhost" in any letter case becomes the IPv4 loopback literal.
std::string normalize_host(const std::string& host);
bool is_valid_port(long port);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

int64_t now_millis();
// Random RFC 4122 version 4 identifier.
std::string make_task_id();
std::string format_bytes(uint64_t bytes);

} // namespace pcex
