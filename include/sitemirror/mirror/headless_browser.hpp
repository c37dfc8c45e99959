/*
 * sitemirror - Headless browser contexts
 *
 * A context is one isolated browser session (private profile directory plus
 * the browser process). The renderer opens one per dynamic render and closes
 * it on every path out, including navigation failures.
 */
#ifndef SITEMIRROR_MIRROR_HEADLESS_BROWSER_HPP
#define SITEMIRROR_MIRROR_HEADLESS_BROWSER_HPP

#include <sitemirror/mirror/mirror_config.hpp>
#include <string>
#include <vector>
#include <memory>
#include <sys/types.h>

namespace sitemirror {

class BrowserContext {
public:
    virtual ~BrowserContext() {}
    
    // Load url, let the network settle, return the serialized DOM.
    // Throws RenderError on launch failure, timeout or empty output.
    virtual std::string navigate(const std::string& url) = 0;
    
    // Release the process and profile. Safe to call more than once.
    virtual void close() = 0;
};

class BrowserLauncher {
public:
    virtual ~BrowserLauncher() {}
    
    // Throws RenderError when no context can be created
    virtual std::unique_ptr<BrowserContext> launch() = 0;
};

// Chromium / Chrome in --headless=new mode with --dump-dom
class ChromiumContext : public BrowserContext {
public:
    ChromiumContext(const std::string& executable, const MirrorConfig& config);
    ~ChromiumContext();
    
    std::string navigate(const std::string& url);
    void close();

    const std::string& profile_dir() const { return profile_dir_; }
    
    std::vector<std::string> build_args(const std::string& url) const;

private:
    std::string executable_;
    std::string profile_dir_;
    long timeout_ms_;
    long idle_budget_ms_;
    pid_t pid_;
    bool closed_;

    // Wait for the browser process (killing its group first if force) and
    // return its wait status
    int reap(bool force);
};

class ChromiumLauncher : public BrowserLauncher {
public:
    explicit ChromiumLauncher(const MirrorConfig& config);
    
    std::unique_ptr<BrowserContext> launch();

    // Configured path, else the first chromium/chrome binary on PATH
    std::string resolve_executable() const;

private:
    MirrorConfig config_;
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_HEADLESS_BROWSER_HPP
