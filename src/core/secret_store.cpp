#include "secret_store.hpp"
#include "utils.hpp"
#include <cctype>
#include <fstream>
#include <sys/stat.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

std::string check_secret_file(const fs::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return fmt::format("Secret file {} does not exist", path.string());
    }
    if (!S_ISREG(st.st_mode)) {
        return fmt::format("Secret file {} is not a regular file", path.string());
    }
    if (st.st_mode & (S_IRWXG | S_IRWXO)) {
        return fmt::format("Secret file {} is accessible by group/others (mode {:o}), run chmod 600",
                           path.string(), st.st_mode & 0777);
    }
    return "";
}

std::string check_secret_value(const std::string& secret) {
    for (char c : secret) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return "Secret contains whitespace, which the device command line splits on";
        }
        if (std::string("@:/?#").find(c) != std::string::npos) {
            return fmt::format("Secret contains '{}', which breaks the scp:// destination URL", c);
        }
    }
    return "";
}

Result<std::string> load_secret(const fs::path& path) {
    auto problem = check_secret_file(path);
    if (!problem.empty()) {
        return Result<std::string>::Err(problem);
    }

    std::ifstream f(path);
    if (!f) {
        return Result<std::string>::Err(fmt::format("Secret file {} is not readable", path.string()));
    }

    std::string secret;
    std::getline(f, secret);
    rtrim(secret);
    if (secret.empty()) {
        return Result<std::string>::Err(fmt::format("Secret file {} is empty", path.string()));
    }
    return Result<std::string>::Ok(secret);
}
