#include "flagpole/core/flag_registry.h"
#include "flagpole/core/flag_space.h"
#include <iostream>

using namespace flagpole::core;
using json = nlohmann::json;

int main() {
    // Describe the optional parts of a load balancer
    FlagSpace flags{"BASE", "LISTENERS", "RULES"};
    FlagRegistry registry(flags);

    registry.registerHandler(flags["BASE"], [](const HandlerCall&) {
        return json{{"region", "us-east-1"}, {"_version", 1}};
    });

    registry.registerHandler(flags["LISTENERS"], [](const HandlerCall&) {
        return json::parse(R"([{"ListenerArn": "x"}])");
    }, "listeners");

    registry.registerHandler(flags["RULES"], [](const HandlerCall& call) {
        json rules = json::array();
        for (const auto& listener : call.structure->at("listeners")) {
            rules.push_back(json{{"rule", "y"}, {"listener", listener.at("ListenerArn")}});
        }
        return rules;
    }, "rules", flags["LISTENERS"]);

    auto status = registry.check();
    if (!status) {
        std::cerr << "Registry is invalid: " << status.error() << "\n";
        return 1;
    }

    std::cout << "Flags: " << flags.toString() << "\n";

    json alb = {{"Arn", "abc"}};
    registry.build(flags["RULES"], alb);
    std::cout << "RULES only:\n" << alb.dump(2) << "\n";

    json full = {{"Arn", "abc"}};
    registry.build(flags.all(), full);
    std::cout << "ALL:\n" << full.dump(2) << "\n";

    return 0;
}
