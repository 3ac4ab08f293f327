#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace strata::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual strata::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace strata::application::ports
