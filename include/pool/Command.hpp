#pragma once

#include <memory>
#include <string>
#include <variant>

namespace wh::pool {

class Pool;

struct StartCommand {
    std::string name;
    std::string type;
    std::shared_ptr<Pool> pool;
};

struct StopCommand {
    std::string name;
};

using Command = std::variant<StartCommand, StopCommand>;

}
