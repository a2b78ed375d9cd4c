#include "output_sink.hpp"
#include "errors.hpp"
#include <fstream>
#include <system_error>
#include <utility>

namespace mirror {

filesystem_sink::filesystem_sink(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

void filesystem_sink::create_directories(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw error(error_kind::directory_creation, dir.string(),
                    "error creating directory " + dir.string() + ": " + ec.message());
    }

    // An existing non-directory at `dir` is not success.
    if (!std::filesystem::is_directory(dir, ec)) {
        throw error(error_kind::directory_creation, dir.string(),
                    "error creating directory " + dir.string() + ": path exists and is not a directory");
    }
    m_log->debug("directory ready: {}", dir.string());
}

void filesystem_sink::write_file(const std::filesystem::path& file, std::string_view contents) {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw error(error_kind::write, file.string(),
                    "error writing file " + file.string() + ": cannot open for writing");
    }

    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        throw error(error_kind::write, file.string(),
                    "error writing file " + file.string() + ": write failed");
    }
    m_log->debug("wrote {} bytes to {}", contents.size(), file.string());
}

dry_run_sink::dry_run_sink(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

void dry_run_sink::create_directories(const std::filesystem::path& dir) {
    m_log->info("[dry-run] mkdir -p {}", dir.string());
}

void dry_run_sink::write_file(const std::filesystem::path& file, std::string_view contents) {
    m_log->info("[dry-run] write {} ({} bytes)", file.string(), contents.size());
}

} // namespace mirror
