#pragma once

#include "ports/output/IClock.hpp"

namespace arena::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() override {
        return domain::Timestamp::now();
    }
};

} // namespace arena::adapters::secondary
