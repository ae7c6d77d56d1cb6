#pragma once

#include "render/Renderer.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio::test {

// Records every HTML string it receives and returns fixed bytes,
// or throws RenderError when failWith is set, or a bare int when throwNonStandard is set.
class FakeRenderer final : public render::Renderer {
public:
    std::vector<uint8_t> output{'%', 'P', 'D', 'F', '-', '1', '.', '4', '\n', 0x00, 0xFF, 0x7F, 0x80, '\n'};
    std::optional<std::string> failWith;
    bool throwNonStandard = false;

    std::vector<uint8_t> render(const std::string& html) override {
        {
            std::scoped_lock lock(mutex_);
            calls_.push_back(html);
        }
        if (throwNonStandard) throw 42;
        if (failWith) throw render::RenderError(*failWith);
        return output;
    }

    [[nodiscard]] std::size_t callCount() const {
        std::scoped_lock lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::string lastHtml() const {
        std::scoped_lock lock(mutex_);
        return calls_.empty() ? std::string{} : calls_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

}
