#ifndef SITEMIRROR_CORE_ERRORS_HPP
#define SITEMIRROR_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sitemirror {

enum class CloneErrorKind {
    VALIDATION,   // bad target URL, nothing was touched
    RENDER,       // neither static nor headless path produced a document
    PERSISTENCE,  // could not write the folder, an asset or the archive
    ASSET_FETCH   // single asset; never escapes the fetcher
};

const char* clone_error_kind_str(CloneErrorKind kind);

// Base of every failure that ends a clone run
class CloneError : public std::runtime_error {
public:
    CloneError(CloneErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    
    CloneErrorKind kind() const { return kind_; }

private:
    CloneErrorKind kind_;
};

class ValidationError : public CloneError {
public:
    explicit ValidationError(const std::string& what)
        : CloneError(CloneErrorKind::VALIDATION, what) {}
};

class RenderError : public CloneError {
public:
    explicit RenderError(const std::string& what)
        : CloneError(CloneErrorKind::RENDER, what) {}
};

class PersistenceError : public CloneError {
public:
    explicit PersistenceError(const std::string& what)
        : CloneError(CloneErrorKind::PERSISTENCE, what) {}
};

class AssetFetchError : public CloneError {
public:
    explicit AssetFetchError(const std::string& what)
        : CloneError(CloneErrorKind::ASSET_FETCH, what) {}
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_ERRORS_HPP
