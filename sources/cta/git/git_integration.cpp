//
// Created by gregorian-rayne on 10/5/26.
//

#include "cta/git/git_integration.hpp"
#include "cta/utils/string_utils.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cta::git
{
    namespace {

        /**
         * Owns a pipe end and closes it on scope exit.
         */
        class FileDescriptor {
        public:
            FileDescriptor() = default;
            explicit FileDescriptor(const int fd) : fd_(fd) {}
            ~FileDescriptor() { reset(); }

            FileDescriptor(const FileDescriptor&) = delete;
            FileDescriptor& operator=(const FileDescriptor&) = delete;

            FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
            FileDescriptor& operator=(FileDescriptor&& other) noexcept {
                if (this != &other) {
                    reset();
                    fd_ = other.fd_;
                    other.fd_ = -1;
                }
                return *this;
            }

            [[nodiscard]] int get() const noexcept { return fd_; }

            void reset() noexcept {
                if (fd_ >= 0) {
                    ::close(fd_);
                    fd_ = -1;
                }
            }

        private:
            int fd_ = -1;
        };

        struct Pipe {
            FileDescriptor read_end;
            FileDescriptor write_end;
        };

        Result<Pipe, Error> make_pipe() {
            int fds[2];
            if (::pipe(fds) < 0) {
                return Result<Pipe, Error>::failure(
                    Error::internal_error("Failed to create pipe", std::strerror(errno))
                );
            }
            return Result<Pipe, Error>::success(Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])});
        }

        /**
         * Renders the command for error messages.
         */
        std::string describe_command(const std::vector<std::string>& args) {
            std::ostringstream cmd;
            cmd << "git";
            for (const auto& arg : args) {
                cmd << " " << arg;
            }
            return cmd.str();
        }

        /**
         * Runs git with the given arguments. stdout is either buffered into
         * the result or handed to @p on_output; stderr is always buffered.
         */
        Result<CommandResult, Error> run_git_process(
            const std::vector<std::string>& args,
            const fs::path& working_dir,
            const Duration timeout,
            const OutputHandler* on_output
        ) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            auto out_pipe = make_pipe();
            if (out_pipe.is_err()) {
                return Result<CommandResult, Error>::failure(out_pipe.error());
            }
            auto err_pipe = make_pipe();
            if (err_pipe.is_err()) {
                return Result<CommandResult, Error>::failure(err_pipe.error());
            }

            std::vector<char*> argv;
            argv.reserve(args.size() + 2);
            argv.push_back(const_cast<char*>("git"));
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            const pid_t pid = ::fork();
            if (pid < 0) {
                return Result<CommandResult, Error>::failure(
                    Error::internal_error("Failed to fork git process", std::strerror(errno))
                );
            }

            if (pid == 0) {
                // Child process
                ::dup2(out_pipe.value().write_end.get(), STDOUT_FILENO);
                ::dup2(err_pipe.value().write_end.get(), STDERR_FILENO);
                ::close(out_pipe.value().read_end.get());
                ::close(err_pipe.value().read_end.get());
                ::close(out_pipe.value().write_end.get());
                ::close(err_pipe.value().write_end.get());

                if (::chdir(working_dir.c_str()) != 0) {
                    _exit(127);
                }

                ::execvp("git", argv.data());
                _exit(127);
            }

            // Parent process
            out_pipe.value().write_end.reset();
            err_pipe.value().write_end.reset();

            FileDescriptor out_fd = std::move(out_pipe.value().read_end);
            FileDescriptor err_fd = std::move(err_pipe.value().read_end);

            std::array<pollfd, 2> fds{{
                {out_fd.get(), POLLIN, 0},
                {err_fd.get(), POLLIN, 0}
            }};

            const bool has_timeout = timeout > Duration::zero();
            const auto deadline = start_time + timeout;
            bool timed_out = false;
            std::array<char, 8192> buffer{};

            while (fds[0].fd >= 0 || fds[1].fd >= 0) {
                int wait_ms = -1;
                if (has_timeout) {
                    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()
                    );
                    if (remaining.count() <= 0) {
                        timed_out = true;
                        break;
                    }
                    wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 1000));
                }

                const int ready = ::poll(fds.data(), fds.size(), wait_ms);
                if (ready < 0) {
                    if (errno == EINTR) continue;
                    ::kill(pid, SIGKILL);
                    ::waitpid(pid, nullptr, 0);
                    return Result<CommandResult, Error>::failure(
                        Error::internal_error("poll() failed while reading git output", std::strerror(errno))
                    );
                }
                if (ready == 0) continue;

                for (std::size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                        continue;
                    }

                    const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
                    if (n < 0) {
                        if (errno == EINTR || errno == EAGAIN) continue;
                        fds[i].fd = -1;
                        continue;
                    }
                    if (n == 0) {
                        fds[i].fd = -1;
                        continue;
                    }

                    const std::string_view chunk(buffer.data(), static_cast<std::size_t>(n));
                    if (i == 1) {
                        result.stderr_output.append(chunk);
                    } else if (on_output == nullptr) {
                        result.stdout_output.append(chunk);
                    } else if (!(*on_output)(chunk)) {
                        result.stopped_by_caller = true;
                        fds[0].fd = -1;
                        fds[1].fd = -1;
                        break;
                    }
                }
            }

            if (timed_out || result.stopped_by_caller) {
                ::kill(pid, timed_out ? SIGKILL : SIGTERM);
            }

            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return Result<CommandResult, Error>::failure(
                        Error::internal_error("Failed to reap git process", std::strerror(errno))
                    );
                }
            }

            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = -WTERMSIG(status);
            }

            result.execution_time = std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start_time
            );

            if (timed_out) {
                return Result<CommandResult, Error>::failure(
                    Error::repository_error("Git command timed out", describe_command(args))
                );
            }
            if (result.exit_code == 127 && !result.stopped_by_caller) {
                return Result<CommandResult, Error>::failure(
                    Error::repository_error("Failed to execute git", describe_command(args))
                );
            }

            return Result<CommandResult, Error>::success(std::move(result));
        }

        Result<void, Error> check_working_dir(const fs::path& working_dir) {
            if (std::error_code ec; !fs::is_directory(working_dir, ec)) {
                return Result<void, Error>::failure(
                    Error::not_found("Working directory not found", working_dir.string())
                );
            }
            return Result<void, Error>::success();
        }

    }  // namespace

    // =============================================================================
    // Core Git Functions
    // =============================================================================

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout
    ) {
        if (auto dir_ok = check_working_dir(working_dir); dir_ok.is_err()) {
            return Result<CommandResult, Error>::failure(dir_ok.error());
        }
        return run_git_process(args, working_dir, timeout, nullptr);
    }

    Result<CommandResult, Error> stream_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const OutputHandler& on_output,
        const Duration timeout
    ) {
        if (auto dir_ok = check_working_dir(working_dir); dir_ok.is_err()) {
            return Result<CommandResult, Error>::failure(dir_ok.error());
        }
        return run_git_process(args, working_dir, timeout, &on_output);
    }

    bool is_git_repository(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--is-inside-work-tree"},
            dir,
            std::chrono::seconds(5)
        );
        return result.is_ok() &&
               result.value().exit_code == 0 &&
               string_utils::trim(result.value().stdout_output) == "true";
    }

    Result<fs::path, Error> get_repository_root(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--show-toplevel"},
            dir,
            std::chrono::seconds(5)
        );

        if (result.is_err()) {
            return Result<fs::path, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<fs::path, Error>::failure(
                Error::repository_error("Not a git repository", dir.string())
            );
        }

        return Result<fs::path, Error>::success(
            fs::path(std::string(string_utils::trim(result.value().stdout_output)))
        );
    }

    Result<std::string, Error> get_head(const fs::path& repo_dir) {
        auto result = execute_git(
            {"rev-parse", "--verify", "--quiet", "HEAD^{commit}"},
            repo_dir,
            std::chrono::seconds(5)
        );

        if (result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::string, Error>::failure(
                Error::repository_error("Failed to resolve HEAD (empty repository?)", repo_dir.string())
            );
        }

        return Result<std::string, Error>::success(std::string(string_utils::trim(result.value().stdout_output)));
    }

    Result<std::string, Error> open_repository(const fs::path& repo_dir) {
        if (std::error_code ec; !fs::is_directory(repo_dir, ec)) {
            return Result<std::string, Error>::failure(
                Error::repository_error("Repository path is not a directory", repo_dir.string())
            );
        }

        if (!is_git_repository(repo_dir)) {
            return Result<std::string, Error>::failure(
                Error::repository_error("Not a git repository", repo_dir.string())
            );
        }

        // Pathspecs resolve against the working directory, so a subdirectory
        // of a work tree would silently match nothing.
        auto root = get_repository_root(repo_dir);
        if (root.is_err()) {
            return Result<std::string, Error>::failure(root.error());
        }

        if (std::error_code ec; !fs::equivalent(root.value(), repo_dir, ec) || ec) {
            return Result<std::string, Error>::failure(
                Error::repository_error("Not the top level of a git repository", repo_dir.string())
                    .with_context("top level is " + root.value().string())
            );
        }

        return get_head(repo_dir);
    }

}  // namespace cta::git
