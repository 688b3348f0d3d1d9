#include "llm/ProcUtil.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <sys/wait.h>
#include <unistd.h>

namespace procutil {

ProcResult run_capture(const std::string& cmdline) {
    ProcResult r;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return r;

    r.output.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        r.output.append(buf, buf + n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        r.exit_code = -1;
    } else if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
    } else {
        r.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return r;
}

std::string shell_quote(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 8);
    o += '\'';
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += '\'';
    return o;
}

namespace {

// mkstemp-backed file removed on scope exit
class TempFile {
public:
    TempFile() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "netmatch-XXXXXX").string();
        const int fd = mkstemp(tmpl.data());
        if (fd < 0) {
            throw std::runtime_error(std::string("mkstemp failed: ") + std::strerror(errno));
        }
        fd_ = fd;
        path_ = tmpl;
    }

    ~TempFile() {
        if (fd_ >= 0) close(fd_);
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    void write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            const ssize_t w = ::write(fd_, p, left);
            if (w < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("temp file write failed: ") + std::strerror(errno));
            }
            p += w;
            left -= static_cast<size_t>(w);
        }
        close(fd_);
        fd_ = -1;
    }

    const std::string& path() const { return path_; }

private:
    int fd_ = -1;
    std::string path_;
};

} // namespace

std::string curl_post_json(const std::string& url, const std::string& body, int timeout_seconds) {
    TempFile payload;
    payload.write_all(body);

    std::string cmd = "curl -sS --fail-with-body";
    cmd += " --max-time " + std::to_string(timeout_seconds > 0 ? timeout_seconds : 60);
    cmd += " -H 'Content-Type: application/json'";
    cmd += " --data-binary " + shell_quote("@" + payload.path());
    cmd += " " + shell_quote(url);
    cmd += " 2>&1";

    ProcResult r = run_capture(cmd);
    if (r.exit_code == -1) {
        throw std::runtime_error("failed to start curl");
    }
    if (r.exit_code != 0) {
        std::string detail = r.output.substr(0, 300);
        throw std::runtime_error("curl exited with " + std::to_string(r.exit_code) + " for " + url + ": " + detail);
    }
    return r.output;
}

} // namespace procutil
