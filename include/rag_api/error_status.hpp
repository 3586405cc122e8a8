#pragma once

#include <exception>

namespace rag_api {

// Maps an exception escaping a route handler to its HTTP status code.
int http_status_for(const std::exception &e);

}  // namespace rag_api
