#include <sitemirror/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>
#include <openssl/sha.h>

namespace sitemirror {

// ============ Time utilities ============

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    
    bool a_ends_slash = !a.empty() && a.back() == '/';
    bool b_starts_slash = !b.empty() && b[0] == '/';
    
    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string basename(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::string dirname(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string absolute_path(const std::string& path) {
    if (!path.empty() && path[0] == '/') return path;

    char buf[4096];
    if (getcwd(buf, sizeof(buf)) == NULL) return path;
    std::string cwd(buf);
    if (path.empty() || path == ".") return cwd;
    if (starts_with(path, "./")) return join_path(cwd, path.substr(2));
    return join_path(cwd, path);
}

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

bool mkdir_p(const std::string& path) {
    if (path.empty()) return false;
    
    std::vector<std::string> parts = split(path, '/');
    std::string current;
    
    if (path[0] == '/') {
        current = "/";
    }
    
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current = join_path(current, parts[i]);
        
        if (mkdir(current.c_str(), 0755) != 0) {
            // Another worker may have created it first
            if (errno != EEXIST || !is_directory(current)) {
                return false;
            }
        }
    }
    
    return true;
}

namespace {

void collect_files(const std::string& root, const std::string& rel,
                   std::vector<std::string>& out) {
    std::string dir = rel.empty() ? root : join_path(root, rel);
    DIR* d = opendir(dir.c_str());
    if (!d) return;

    struct dirent* entry;
    while ((entry = readdir(d)) != NULL) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;

        std::string child_rel = rel.empty() ? name : rel + "/" + name;
        std::string child = join_path(root, child_rel);
        struct stat st;
        if (lstat(child.c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            collect_files(root, child_rel, out);
        } else if (S_ISREG(st.st_mode)) {
            out.push_back(child_rel);
        }
    }
    closedir(d);
}

} // namespace

std::vector<std::string> list_files_recursive(const std::string& root) {
    std::vector<std::string> files;
    collect_files(root, "", files);
    std::sort(files.begin(), files.end());
    return files;
}

bool remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    bool ok = true;
    DIR* d = opendir(path.c_str());
    if (d) {
        struct dirent* entry;
        while ((entry = readdir(d)) != NULL) {
            std::string name = entry->d_name;
            if (name == "." || name == "..") continue;
            if (!remove_tree(join_path(path, name))) ok = false;
        }
        closedir(d);
    }
    if (rmdir(path.c_str()) != 0) ok = false;
    return ok;
}

std::string make_temp_dir(const std::string& prefix) {
    const char* tmp = std::getenv("TMPDIR");
    std::string base = (tmp && tmp[0]) ? tmp : "/tmp";
    std::string templ = join_path(base, prefix + "XXXXXX");

    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(&buf[0]) == NULL) {
        return "";
    }
    return std::string(&buf[0]);
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::vector<std::string> dirs = split(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin", ':');
    for (size_t i = 0; i < dirs.size(); ++i) {
        if (dirs[i].empty()) continue;
        std::string candidate = join_path(dirs[i], name);
        if (access(candidate.c_str(), X_OK) == 0 && !is_directory(candidate)) {
            return candidate;
        }
    }
    return "";
}

// ============ File utilities ============

bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path.c_str(), std::ios::in | std::ios::binary);
    if (!f.is_open()) return false;
    out.assign((std::istreambuf_iterator<char>(f)),
               std::istreambuf_iterator<char>());
    return !f.bad();
}

bool write_file(const std::string& path, const std::string& data) {
    std::ofstream f(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return false;
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.close();
    return !f.fail();
}

bool copy_file(const std::string& from, const std::string& to) {
    std::ifstream in(from.c_str(), std::ios::in | std::ios::binary);
    if (!in.is_open()) return false;
    std::ofstream out(to.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;

    char buffer[65536];
    while (in) {
        in.read(buffer, sizeof(buffer));
        std::streamsize n = in.gcount();
        if (n > 0) out.write(buffer, n);
    }
    out.close();
    return !out.fail() && !in.bad();
}

// ============ Hashing utilities ============

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace sitemirror
