#include "file_utils.h"
#include "constants.h"
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace coderun {

namespace fs = std::filesystem;

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buffer(num_bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a script identifier");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string FileUtils::unique_script_name(const std::string& extension) {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "run_" + std::to_string(now_ms) + "_" + random_hex(SCRIPT_ID_BYTES) + extension;
}

fs::path FileUtils::create_private_directory(const fs::path& root, const std::string& prefix) {
    std::string pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create working directory under " +
                                 root.string() + ": " + std::strerror(errno));
    }
    return fs::path(buffer.data());
}

TempScript::TempScript(const fs::path& directory,
                       const std::string& extension,
                       const std::string& content)
    : path_(directory / FileUtils::unique_script_name(extension)) {
    std::ofstream script_file(path_, std::ios::binary | std::ios::trunc);
    if (!script_file) {
        throw std::runtime_error("Failed to create temporary script file: " + path_.string());
    }

    script_file << content;
    script_file.close();
    if (!script_file) {
        std::error_code ec;
        fs::remove(path_, ec);
        throw std::runtime_error("Failed to write temporary script file: " + path_.string());
    }
}

TempScript::~TempScript() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "[Executor] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    }
}

} // namespace coderun
