#include "utils.hpp"

#include <unistd.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    return hex_from_bytes(b.data(), b.size());
}

std::string hex_from_bytes(const unsigned char* data, std::size_t length){
    std::ostringstream oss;
    for(std::size_t i = 0; i < length; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::vector<std::string> split_whitespace(const std::string& line){
    std::istringstream in(line);
    std::vector<std::string> out;
    std::string token;
    while(in >> token) out.push_back(token);
    return out;
}

std::string format_local_time(std::time_t when){
    std::tm local{};
    localtime_r(&when, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::optional<std::filesystem::path> find_program(const std::string& name){
    auto executable = [](const std::filesystem::path& candidate){
        std::error_code ec;
        return std::filesystem::exists(candidate, ec) &&
               !std::filesystem::is_directory(candidate, ec) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if(name.find('/') != std::string::npos) {
        if(executable(name)) return std::filesystem::path(name);
        return std::nullopt;
    }

    const char* env = std::getenv("PATH");
    std::string search = env ? env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while(std::getline(dirs, dir, ':')) {
        if(dir.empty()) dir = ".";
        auto candidate = std::filesystem::path(dir) / name;
        if(executable(candidate)) return candidate;
    }
    return std::nullopt;
}

bool is_hidden_name(const std::string& name){
    return !name.empty() && name[0] == '.';
}
