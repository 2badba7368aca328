#pragma once
#include "../tool.hpp"
#include <functional>
#include <string>
#include <vector>

namespace arena {

using SearchFunction = std::function<std::vector<std::string>(const std::string&)>;

// Wraps a caller-supplied search backend. Results come back as a JSON array.
class SearchTool : public Tool {
public:
    explicit SearchTool(SearchFunction fn);

    const std::string& name() const override { return name_; }
    const std::string& description() const override { return description_; }
    const nlohmann::json& schema() const override { return schema_; }

    std::string execute(const nlohmann::json& args) override;

private:
    std::string name_ = "search";
    std::string description_ = "Search for information using the provided query";
    nlohmann::json schema_;
    SearchFunction fn_;
};

} // namespace arena
