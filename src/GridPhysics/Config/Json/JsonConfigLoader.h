#pragma once

#include "GridPhysics/IConfig.h"
#include <nlohmann/json.hpp>

namespace GridPhysics {

class JsonConfigLoader : public IConfig
{
public:
    JsonConfigLoader() = default;
    ~JsonConfigLoader() override = default;

    bool Load(const std::string &filePath) override;
    const GridConfig &GetConfig() const override;

private:
    GridConfig _config;
};

} // namespace GridPhysics
