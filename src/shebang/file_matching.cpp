#include <shebang/file_matching.hpp>

#include <algorithm>
#include <cctype>

namespace shebang {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Extension without the dot, or "" for none (including bare dot-files)
std::string extension_of(const std::string& filename) {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == 0 ||
        dot_pos == filename.length() - 1) {
        return "";
    }
    return filename.substr(dot_pos + 1);
}

}  // namespace

FileMatchingInfo FileMatchingInfo::defaults() {
    FileMatchingInfo info;
    info.file_extensions = {
        "awk",
        "bats",
        "cgi",
        "d",                // rdmd
        "exs",              // Elixir
        "java",             // JEP 330 source files
        "js", "ts",
        "kts",              // Kotlin script
        "lua",
        "mk",
        "php", "php3", "php4", "php5",
        "pl", "t", "perl",
        // Debian maintainer scripts
        "postinst", "postrm", "preinst", "prerm",
        "ps1",
        "py",
        "rb",
        "sed",
        "sh", "bash", "csh", "fish", "ksh", "tcsh", "zsh",
        "SlackBuild",
        "stp",              // SystemTap
    };
    info.file_names = {
        "Makefile", "GNUmakefile",
    };
    return info;
}

bool FileMatchingInfo::matches(const fs::path& path) const {
    std::string filename = path.filename().string();
    if (filename.empty()) {
        return false;
    }

    if (std::find(file_names.begin(), file_names.end(), filename) != file_names.end()) {
        return true;
    }

    std::string ext = extension_of(filename);
    if (ext.empty()) {
        return false;
    }

    ext = to_lower(ext);
    return std::any_of(file_extensions.begin(), file_extensions.end(),
                       [&ext](const std::string& candidate) {
                           return to_lower(candidate) == ext;
                       });
}

}  // namespace shebang
