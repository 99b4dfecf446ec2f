#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace shuttle::ipc::operation {

struct ModifySettings {
    std::string key;
    nlohmann::json value;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ModifySettings, key, value);
};

} // namespace shuttle::ipc::operation
