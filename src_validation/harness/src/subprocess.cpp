#include "bundle_validation/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#else
  #include <fcntl.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <unistd.h>
  #ifdef __APPLE__
    #include <crt_externs.h>
    #define environ (*_NSGetEnviron())
  #else
extern char** environ;
  #endif
#endif

namespace fs = std::filesystem;

namespace {

void split_entry(std::string_view entry, bundle::validation::Environment& out) {
    // Windows keeps per-drive cwd entries such as "=C:=C:\\"; the name starts at 0.
    const auto eq = entry.find('=', 1);
    if (eq == std::string_view::npos) {
        return;
    }
    out[std::string{entry.substr(0, eq)}] = std::string{entry.substr(eq + 1)};
}

#ifdef _WIN32

std::wstring widen(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    const int size = ::MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                           nullptr, 0);
    std::wstring out(static_cast<std::size_t>(size), L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), out.data(), size);
    return out;
}

std::string narrow(std::wstring_view text) {
    if (text.empty()) {
        return {};
    }
    const int size = ::WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                           nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(size), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), out.data(), size,
                          nullptr, nullptr);
    return out;
}

// CommandLineToArgvW-compatible quoting.
void append_quoted(std::wstring& cmd, const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
        cmd += arg;
        return;
    }
    cmd.push_back(L'"');
    for (auto it = arg.begin();; ++it) {
        std::size_t backslashes = 0;
        while (it != arg.end() && *it == L'\\') {
            ++it;
            ++backslashes;
        }
        if (it == arg.end()) {
            cmd.append(backslashes * 2, L'\\');
            break;
        }
        if (*it == L'"') {
            cmd.append(backslashes * 2 + 1, L'\\');
        } else {
            cmd.append(backslashes, L'\\');
        }
        cmd.push_back(*it);
    }
    cmd.push_back(L'"');
}

std::wstring make_environment_block(const bundle::validation::Environment& env) {
    std::vector<std::wstring> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(widen(key) + L"=" + widen(value));
    }
    std::sort(entries.begin(), entries.end(), [](const std::wstring& a, const std::wstring& b) {
        return ::_wcsicmp(a.c_str(), b.c_str()) < 0;
    });
    std::wstring block;
    for (const auto& entry : entries) {
        block += entry;
        block.push_back(L'\0');
    }
    block.push_back(L'\0');
    return block;
}

#endif

}  // namespace

namespace bundle::validation {

Environment current_environment() {
    Environment env;
#ifdef _WIN32
    wchar_t* block = ::GetEnvironmentStringsW();
    if (block == nullptr) {
        return env;
    }
    for (const wchar_t* cursor = block; *cursor != L'\0';) {
        const std::wstring_view entry{cursor};
        split_entry(narrow(entry), env);
        cursor += entry.size() + 1;
    }
    ::FreeEnvironmentStringsW(block);
#else
    for (char** cursor = environ; cursor != nullptr && *cursor != nullptr; ++cursor) {
        split_entry(*cursor, env);
    }
#endif
    return env;
}

#ifdef _WIN32

int run_subprocess(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("run_subprocess: empty argument vector");
    }

    fs::path exe = spec.executable.empty() ? fs::path(spec.argv.front()) : spec.executable;
    if (exe.is_relative() && !spec.cwd.empty()) {
        exe = spec.cwd / exe;
    }

    std::wstring cmd;
    for (std::size_t i = 0; i < spec.argv.size(); ++i) {
        if (i > 0) {
            cmd.push_back(L' ');
        }
        append_quoted(cmd, widen(spec.argv[i]));
    }

    std::wstring env_block;
    if (spec.env) {
        env_block = make_environment_block(*spec.env);
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    HANDLE out_handle = INVALID_HANDLE_VALUE;
    if (!spec.stdout_path.empty()) {
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        out_handle = ::CreateFileW(spec.stdout_path.wstring().c_str(), GENERIC_WRITE,
                                   FILE_SHARE_READ, &sa, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL,
                                   nullptr);
        if (out_handle == INVALID_HANDLE_VALUE) {
            throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(),
                                    "Unable to open " + spec.stdout_path.string());
        }
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdInput = ::GetStdHandle(STD_INPUT_HANDLE);
        si.hStdOutput = out_handle;
        si.hStdError = ::GetStdHandle(STD_ERROR_HANDLE);
    }

    std::cout.flush();
    std::cerr.flush();

    PROCESS_INFORMATION pi{};
    const std::wstring cwd = spec.cwd.wstring();
    const BOOL created = ::CreateProcessW(
        exe.wstring().c_str(), cmd.data(), nullptr, nullptr, TRUE,
        spec.env ? CREATE_UNICODE_ENVIRONMENT : 0,
        spec.env ? env_block.data() : nullptr,
        cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
    const DWORD create_error = ::GetLastError();

    if (out_handle != INVALID_HANDLE_VALUE) {
        ::CloseHandle(out_handle);
    }
    if (!created) {
        throw std::system_error(static_cast<int>(create_error), std::system_category(),
                                "Unable to launch " + exe.string());
    }

    ::WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 0;
    const BOOL have_code = ::GetExitCodeProcess(pi.hProcess, &code);
    ::CloseHandle(pi.hThread);
    ::CloseHandle(pi.hProcess);
    if (!have_code) {
        throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(),
                                "Unable to read exit code of " + exe.string());
    }
    return static_cast<int>(code);
}

#else

int run_subprocess(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw std::invalid_argument("run_subprocess: empty argument vector");
    }

    // Everything the child touches is prepared before fork().
    const std::string exe = spec.executable.empty() ? spec.argv.front() : spec.executable.string();
    const std::string cwd = spec.cwd.string();

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (spec.env) {
        env_strings.reserve(spec.env->size());
        for (const auto& [key, value] : *spec.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (auto& entry : env_strings) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
    }

    int out_fd = -1;
    if (!spec.stdout_path.empty()) {
        out_fd = ::open(spec.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (out_fd < 0) {
            throw std::system_error(errno, std::generic_category(),
                                    "Unable to open " + spec.stdout_path.string());
        }
    }

    // The child reports exec failures through this pipe; a successful exec closes it.
    int status_pipe[2];
    if (::pipe(status_pipe) != 0) {
        const int err = errno;
        if (out_fd >= 0) ::close(out_fd);
        throw std::system_error(err, std::generic_category(), "pipe");
    }
    ::fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        if (out_fd >= 0) ::close(out_fd);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        auto fail = [&](int err) {
            (void)!::write(status_pipe[1], &err, sizeof(err));
            ::_exit(127);
        };
        ::close(status_pipe[0]);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            fail(errno);
        }
        if (out_fd >= 0 && ::dup2(out_fd, STDOUT_FILENO) < 0) {
            fail(errno);
        }
        if (spec.env) {
            ::execve(exe.c_str(), argv.data(), envp.data());
        } else {
            ::execv(exe.c_str(), argv.data());
        }
        fail(errno);
    }

    ::close(status_pipe[1]);
    if (out_fd >= 0) {
        ::close(out_fd);
    }

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        throw std::system_error(child_errno, std::generic_category(), "Unable to launch " + exe);
    }
    if (waited < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

#endif

std::optional<fs::path> find_program(std::string_view name, std::string_view search_path) {
    if (name.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    const fs::path direct{std::string{name}};
    if (direct.has_parent_path()) {
        if (fs::is_regular_file(direct, ec)) {
            return direct;
        }
        return std::nullopt;
    }

#ifdef _WIN32
    constexpr char kSeparator = ';';
    const std::vector<std::string> candidates = {std::string{name}, std::string{name} + ".exe"};
#else
    constexpr char kSeparator = ':';
    const std::vector<std::string> candidates = {std::string{name}};
#endif

    std::size_t begin = 0;
    while (begin <= search_path.size()) {
        auto end = search_path.find(kSeparator, begin);
        if (end == std::string_view::npos) {
            end = search_path.size();
        }
        const auto dir_text = search_path.substr(begin, end - begin);
        const fs::path dir = dir_text.empty() ? fs::path(".") : fs::path(std::string{dir_text});
        for (const auto& candidate : candidates) {
            const auto full = dir / candidate;
            if (!fs::is_regular_file(full, ec)) {
                continue;
            }
#ifndef _WIN32
            if (::access(full.c_str(), X_OK) != 0) {
                continue;
            }
#endif
            return full;
        }
        begin = end + 1;
    }
    return std::nullopt;
}

}  // namespace bundle::validation
