#pragma once

#include <functional>
#include <map>
#include <string>

#include "api/Controllers.hpp"

namespace wsm::api {

class Router {
public:
    Router();

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
};

}  // namespace wsm::api
