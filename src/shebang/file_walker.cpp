#include <shebang/file_walker.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace shebang {

Result<std::vector<fs::path>> collect_files(const std::vector<fs::path>& paths,
                                            const FileMatchingInfo& matching,
                                            bool all_files,
                                            Logger* logger) {
    NullLogger null_logger;
    Logger& log = logger ? *logger : null_logger;

    std::vector<fs::path> files;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            // Named explicitly: no filetype gating
            files.push_back(path);
            continue;
        }

        fs::recursive_directory_iterator it(path, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            if (!all_files && !matching.matches(it->path())) {
                log.debug("Skipping " + it->path().string() + ": not a script type");
                continue;
            }
            files.push_back(it->path());
        }
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Cannot walk " + path.string() + ": " + ec.message());
        }
    }

    return files;
}

Result<FileOutcome> format_file(const PluginHandler& handler,
                                const fs::path& path,
                                bool check) {
    auto content = read_text_file(path);
    if (!content.ok()) {
        return content.error();
    }

    FormatRequest request;
    request.file_path = path;
    request.file_text = std::move(content.value());

    // A whole-file request carries no range, so the handler has no error to report
    auto result = handler.format(request);
    if (!result.ok()) {
        return Error(ErrorCode::INTERNAL_ERROR, result.error().to_string());
    }

    const auto& formatted = result.value();
    if (!formatted) {
        return FileOutcome::UNCHANGED;
    }
    if (check) {
        return FileOutcome::NEEDS_FORMATTING;
    }

    auto written = replace_file(path, *formatted);
    if (!written.ok()) {
        return written.error();
    }
    return FileOutcome::FORMATTED;
}

Result<std::string> read_text_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "No such file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "Cannot read " + path.string());
    }
    return ss.str();
}

Result<void> replace_file(const fs::path& path, const std::string& content) {
    std::error_code ec;

    // Replace the link target, not the link
    fs::path target = path;
    if (fs::is_symlink(path, ec)) {
        target = fs::canonical(path, ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Cannot resolve " + path.string() + ": " + ec.message());
        }
    }

    fs::perms perms = fs::status(target, ec).permissions();
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot stat " + target.string() + ": " + ec.message());
    }

    std::string temp_path = target.string() + ".XXXXXX";
    int fd = mkstemp(&temp_path[0]);
    if (fd == -1) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot create temporary file next to " + target.string() +
                     ": " + std::strerror(errno));
    }
    close(fd);

    auto fail = [&temp_path](const std::string& message) {
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        return Error(ErrorCode::IO_ERROR, message);
    };

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail("Cannot open for writing: " + temp_path);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            return fail("Write failed: " + temp_path);
        }
    }

    fs::permissions(temp_path, perms, fs::perm_options::replace, ec);
    if (ec) {
        return fail("Cannot set permissions on " + temp_path + ": " + ec.message());
    }

    fs::rename(temp_path, target, ec);
    if (ec) {
        return fail("Cannot replace " + target.string() + ": " + ec.message());
    }
    return Ok();
}

}  // namespace shebang
