#include "uldas/metadata_writer.h"
#include "uldas/language_codes.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace uldas {

namespace {

bool is_executable(const std::string& path) {
    return ::access(path.c_str(), X_OK) == 0;
}

std::string file_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string last_line(const std::string& output) {
    std::string trimmed = output;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) trimmed.pop_back();
    size_t nl = trimmed.find_last_of('\n');
    return nl == std::string::npos ? trimmed : trimmed.substr(nl + 1);
}

} // anonymous namespace

std::string subtitle_track_name(const std::string& language_code, bool forced, bool sdh) {
    std::string name = language_display_name(language_code);
    if (forced) name += " [Forced]";
    if (sdh) name += " [SDH]";
    return name;
}

MkvPropEditWriter::MkvPropEditWriter(std::string executable, bool dry_run)
    : executable_(std::move(executable))
    , dry_run_(dry_run)
{
}

bool MkvPropEditWriter::is_available() const {
    if (executable_.find('/') != std::string::npos) {
        return is_executable(executable_);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_executable(dir + "/" + executable_)) return true;
    }
    return false;
}

std::vector<std::string> MkvPropEditWriter::audio_language_args(const std::string& file_path,
                                                                int audio_index,
                                                                const std::string& language_code) {
    return {
        file_path,
        "--edit", "track:a" + std::to_string(audio_index + 1),
        "--set", "language=" + language_code
    };
}

std::vector<std::string> MkvPropEditWriter::subtitle_metadata_args(const std::string& file_path,
                                                                   int subtitle_index,
                                                                   const std::string& language_code,
                                                                   bool forced,
                                                                   bool sdh) {
    return {
        file_path,
        "--edit", "track:s" + std::to_string(subtitle_index + 1),
        "--set", "language=" + language_code,
        "--set", "name=" + subtitle_track_name(language_code, forced, sdh),
        "--set", std::string("flag-forced=") + (forced ? "1" : "0")
    };
}

bool MkvPropEditWriter::set_audio_language(const std::string& file_path,
                                           int audio_index,
                                           const std::string& language_code) {
    last_error_.clear();

    if (dry_run_) {
        std::cout << "[DRY RUN] Would update track " << audio_index << " in " << file_name(file_path)
                  << " to language: " << language_code << "\n";
        return true;
    }

    return run(audio_language_args(file_path, audio_index, language_code));
}

bool MkvPropEditWriter::set_subtitle_metadata(const std::string& file_path,
                                              int subtitle_index,
                                              const std::string& language_code,
                                              bool forced,
                                              bool sdh) {
    last_error_.clear();

    if (dry_run_) {
        std::cout << "[DRY RUN] Would update subtitle track " << subtitle_index << " in "
                  << file_name(file_path) << ":\n"
                  << "           Language: " << language_code
                  << ", Name: '" << subtitle_track_name(language_code, forced, sdh) << "'"
                  << (forced ? " (forced)" : "") << (sdh ? " (SDH)" : "") << "\n";
        return true;
    }

    return run(subtitle_metadata_args(file_path, subtitle_index, language_code, forced, sdh));
}

bool MkvPropEditWriter::run(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Child stdout + stderr, kept for the error message
    int out_pipe[2];
    if (::pipe(out_pipe) != 0) {
        last_error_ = std::string("pipe failed: ") + std::strerror(errno);
        std::cerr << "[ULDAS] " << last_error_ << "\n";
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        last_error_ = std::string("fork failed: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        std::cerr << "[ULDAS] " << last_error_ << "\n";
        return false;
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::execvp(argv[0], argv.data());
        // Only reached if exec failed
        _exit(127);
    }

    ::close(out_pipe[1]);
    std::string output;
    char buf[512];
    ssize_t n;
    while ((n = ::read(out_pipe[0], buf, sizeof(buf))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(out_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            last_error_ = std::string("waitpid failed: ") + std::strerror(errno);
            std::cerr << "[ULDAS] " << last_error_ << "\n";
            return false;
        }
    }

    if (!WIFEXITED(status)) {
        last_error_ = executable_ + " terminated abnormally";
    } else if (WEXITSTATUS(status) == 127) {
        last_error_ = "Could not run " + executable_;
    } else if (WEXITSTATUS(status) != 0) {
        last_error_ = executable_ + " exited with code " + std::to_string(WEXITSTATUS(status));
        std::string detail = last_line(output);
        if (!detail.empty()) last_error_ += ": " + detail;
    } else {
        return true;
    }

    std::cerr << "[ULDAS] Error updating " << args.front() << ": " << last_error_ << "\n";
    return false;
}

} // namespace uldas
