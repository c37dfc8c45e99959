/*
 * sitemirror - Chromium headless context
 */
#include <sitemirror/mirror/headless_browser.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

namespace sitemirror {

namespace {

static const char* BROWSER_CANDIDATES[] = {
    "chromium",
    "chromium-browser",
    "google-chrome",
    "google-chrome-stable",
    NULL
};

const size_t MAX_DOM_BYTES = 64 * 1024 * 1024;

} // namespace

// ============ ChromiumContext ============

ChromiumContext::ChromiumContext(const std::string& executable, const MirrorConfig& config)
    : executable_(executable)
    , timeout_ms_(config.render_timeout_ms)
    , idle_budget_ms_(config.idle_budget_ms)
    , pid_(-1)
    , closed_(false) {
    profile_dir_ = make_temp_dir("sitemirror-profile-");
    if (profile_dir_.empty()) {
        throw RenderError(std::string("Cannot create browser profile directory: ") + strerror(errno));
    }
    LOG_DEBUG("[headless] Context created (profile %s)", profile_dir_.c_str());
}

ChromiumContext::~ChromiumContext() {
    close();
}

std::vector<std::string> ChromiumContext::build_args(const std::string& url) const {
    std::vector<std::string> args;
    args.push_back(executable_);
    args.push_back("--headless=new");
    // Containers and CI hosts often lack user namespaces
    args.push_back("--no-sandbox");
    args.push_back("--disable-setuid-sandbox");
    args.push_back("--disable-gpu");
    args.push_back("--disable-dev-shm-usage");
    args.push_back("--disable-extensions");
    args.push_back("--disable-background-networking");
    args.push_back("--disable-sync");
    args.push_back("--no-first-run");
    args.push_back("--no-default-browser-check");
    args.push_back("--hide-scrollbars");
    args.push_back("--mute-audio");
    args.push_back("--user-data-dir=" + profile_dir_);

    std::ostringstream budget;
    budget << "--virtual-time-budget=" << idle_budget_ms_;
    args.push_back(budget.str());

    args.push_back("--dump-dom");
    args.push_back(url);
    return args;
}

std::string ChromiumContext::navigate(const std::string& url) {
    if (closed_) {
        throw RenderError("Browser context already closed");
    }

    std::vector<std::string> args = build_args(url);
    std::vector<char*> argv;
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(NULL);

    // Close-on-exec keeps this pipe out of browsers forked by parallel
    // renders; dup2 onto stdout clears the flag in our own child
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw RenderError(std::string("pipe2() failed: ") + strerror(errno));
    }

    LOG_INFO("[headless] Launching %s for %s", executable_.c_str(), url.c_str());

    pid_ = fork();
    if (pid_ < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw RenderError(std::string("fork() failed: ") + strerror(err));
    }

    if (pid_ == 0) {
        // Child: DOM on stdout, discard browser chatter
        setpgid(0, 0);
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::close(fds[0]);
        ::close(fds[1]);
        execvp(argv[0], &argv[0]);
        _exit(127);
    }

    setpgid(pid_, pid_);
    ::close(fds[1]);

    std::string dom;
    char buffer[65536];
    int64_t deadline = monotonic_ms() + timeout_ms_;
    bool timed_out = false;
    bool overflow = false;

    while (true) {
        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) {
            timed_out = true;
            break;
        }

        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;  // EOF, browser exited
        dom.append(buffer, static_cast<size_t>(n));
        if (dom.size() > MAX_DOM_BYTES) {
            overflow = true;
            break;
        }
    }
    ::close(fds[0]);

    int status = reap(timed_out || overflow);

    if (timed_out) {
        std::ostringstream oss;
        oss << "Headless render of " << url << " timed out after " << timeout_ms_ << "ms";
        throw RenderError(oss.str());
    }
    if (overflow) {
        throw RenderError("Headless render of " + url + " produced an oversized document");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        throw RenderError("Cannot execute browser: " + executable_);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::ostringstream oss;
        oss << "Browser exited abnormally (status " << status << ") while rendering " << url;
        throw RenderError(oss.str());
    }
    if (trim(dom).empty()) {
        throw RenderError("Headless render of " + url + " returned an empty document");
    }

    LOG_INFO("[headless] Captured %zu bytes of DOM from %s", dom.size(), url.c_str());
    return dom;
}

int ChromiumContext::reap(bool force) {
    if (pid_ <= 0) return 0;
    if (force) {
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
    }
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
    return status;
}

void ChromiumContext::close() {
    if (closed_) return;
    closed_ = true;

    reap(true);
    if (!remove_tree(profile_dir_)) {
        LOG_WARN("[headless] Could not fully remove profile %s", profile_dir_.c_str());
    }
    LOG_DEBUG("[headless] Context closed");
}

// ============ ChromiumLauncher ============

ChromiumLauncher::ChromiumLauncher(const MirrorConfig& config) : config_(config) {}

std::string ChromiumLauncher::resolve_executable() const {
    if (!config_.browser_path.empty()) {
        return find_executable(config_.browser_path);
    }
    for (size_t i = 0; BROWSER_CANDIDATES[i] != NULL; ++i) {
        std::string path = find_executable(BROWSER_CANDIDATES[i]);
        if (!path.empty()) return path;
    }
    return "";
}

std::unique_ptr<BrowserContext> ChromiumLauncher::launch() {
    std::string exe = resolve_executable();
    if (exe.empty()) {
        throw RenderError(config_.browser_path.empty()
            ? "No headless browser found (tried chromium, chromium-browser, google-chrome)"
            : "Headless browser not executable: " + config_.browser_path);
    }
    return std::unique_ptr<BrowserContext>(new ChromiumContext(exe, config_));
}

} // namespace sitemirror
