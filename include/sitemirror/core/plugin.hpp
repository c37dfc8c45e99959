#ifndef SITEMIRROR_CORE_PLUGIN_HPP
#define SITEMIRROR_CORE_PLUGIN_HPP

#include "config.hpp"
#include <string>

namespace sitemirror {

// Base plugin interface
class Plugin {
public:
    virtual ~Plugin() {}
    
    // Plugin metadata
    virtual const char* name() const = 0;
    virtual const char* version() const = 0;
    virtual const char* description() const { return ""; }
    
    // Lifecycle
    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    
    virtual bool is_initialized() const { return initialized_; }
    
protected:
    bool initialized_;
    
    Plugin() : initialized_(false) {}
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_PLUGIN_HPP
