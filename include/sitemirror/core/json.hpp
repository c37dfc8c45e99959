#ifndef SITEMIRROR_CORE_JSON_HPP
#define SITEMIRROR_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sitemirror {

typedef nlohmann::json Json;

} // namespace sitemirror

#endif // SITEMIRROR_CORE_JSON_HPP
