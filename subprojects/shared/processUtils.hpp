#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/** \brief Outcome of a finished child process. */
struct ProcessResult {
    int exit_code{-1};          ///< Exit status, or 128 + signal number if the child was killed.
    std::string stdout_text;    ///< Everything the child wrote to stdout.
    std::string stderr_text;    ///< Everything the child wrote to stderr.

    bool succeeded() const { return exit_code == 0; }
};

class ProcessUtils {
public:
    // Name of this machine as reported by gethostname(); "localhost" if unavailable.
    static std::string get_host_name();

    // Set current thread name (best-effort, platform-specific)
    static void set_current_thread_name(const std::string& name);

    /**
     * \brief Run a command to completion, capturing its stdout and stderr.
     * \param argv Program (looked up on PATH) followed by its arguments.
     * \param working_dir Directory the child starts in; empty keeps the caller's.
     * \throws std::invalid_argument if argv is empty.
     * \throws std::system_error if the pipes or the child cannot be created.
     *
     * A program that cannot be executed yields exit code 127 with the reason on stderr.
     */
    static ProcessResult run_process(const std::vector<std::string>& argv,
                                     const std::filesystem::path& working_dir = {});
};
