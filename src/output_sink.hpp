#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace mirror {

// Filesystem side effects of a materialization run. Implementations throw
// mirror::error (directory_creation / write) on failure.
class output_sink {
public:
    virtual ~output_sink() = default;

    // Create `dir` and any missing parents. Succeeds if it already exists.
    virtual void create_directories(const std::filesystem::path& dir) = 0;

    // Create or truncate `file` and write `contents` in full.
    virtual void write_file(const std::filesystem::path& file, std::string_view contents) = 0;
};

// Writes to the real filesystem.
class filesystem_sink : public output_sink {
public:
    explicit filesystem_sink(std::shared_ptr<spdlog::logger> log);

    void create_directories(const std::filesystem::path& dir) override;
    void write_file(const std::filesystem::path& file, std::string_view contents) override;

private:
    std::shared_ptr<spdlog::logger> m_log;
};

// Logs what would be written and touches nothing.
class dry_run_sink : public output_sink {
public:
    explicit dry_run_sink(std::shared_ptr<spdlog::logger> log);

    void create_directories(const std::filesystem::path& dir) override;
    void write_file(const std::filesystem::path& file, std::string_view contents) override;

private:
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace mirror
