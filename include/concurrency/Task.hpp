#pragma once

namespace folio::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
