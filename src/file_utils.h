#pragma once

#include <string>
#include <filesystem>

namespace coderun {

class FileUtils {
public:
    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Hex string from a cryptographically random buffer (OpenSSL RAND_bytes)
    static std::string random_hex(size_t num_bytes);

    // "run_<unix-ms>_<random hex><extension>", unique per request
    static std::string unique_script_name(const std::string& extension);

    // Create a private (0700) working directory under root; throws on failure
    static std::filesystem::path create_private_directory(const std::filesystem::path& root,
                                                          const std::string& prefix);
};

// Script file that exists exactly as long as this object does
class TempScript {
public:
    // Writes content to directory/unique name; throws std::runtime_error on failure
    TempScript(const std::filesystem::path& directory,
               const std::string& extension,
               const std::string& content);
    ~TempScript();

    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace coderun
