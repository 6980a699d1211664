#include "utils.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <unistd.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string random_hex_id(std::size_t bytes){
    std::vector<unsigned char> buf(bytes);
    if(RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1){
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return hex_from_bytes(buf);
}

std::string local_hostname(){
    std::array<char, 256> name{};
    if(gethostname(name.data(), name.size() - 1) != 0 || name[0] == '\0'){
        return "Unknown";
    }
    return std::string(name.data());
}

double percent_of(uint64_t done, uint64_t total){
    if(total == 0) return 100.0;
    if(done >= total) return 100.0;
    return static_cast<double>(done) / static_cast<double>(total) * 100.0;
}

std::string format_bytes(uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if(unit == 0) oss << bytes << " " << units[0];
    else oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}
