#pragma once
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string hex_from_bytes(const unsigned char* data, std::size_t length);

// Whitespace separated tokens, empty tokens dropped.
std::vector<std::string> split_whitespace(const std::string& line);

// Local time as "%Y-%m-%d %H:%M:%S".
std::string format_local_time(std::time_t when);

// Looks up an executable on PATH the way `which` does.
std::optional<std::filesystem::path> find_program(const std::string& name);

bool is_hidden_name(const std::string& name);
