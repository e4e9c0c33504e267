#include "plume/layout.hpp"
#include "plume/action_buffer.hpp"
#include "plume/serializer.hpp"
#include "format.hpp"
#include <ostream>
#include <utility>

namespace plume {

// --- Layout ---

Layout Layout::Make(Size2D dimensions, const ActionList& actions, bool debugRender) {
    return Layout{dimensions, actions.actions(), debugRender};
}

bool Layout::serialize(std::ostream& out) const {
    std::string header;
    detail::appendFixed4(header, dimensions.x.toPt());
    header += ' ';
    detail::appendFixed4(header, dimensions.y.toPt());

    ActionWriter writer(&out);
    writer.writeLine(header);
    writer.writeLine(std::to_string(actions.size()));
    for (const auto& action : actions) {
        action.accept(writer);
    }
    return writer.ok();
}

// --- MultiLayout ---

void MultiLayout::add(Layout layout) {
    layouts_.push_back(std::move(layout));
}

void MultiLayout::extend(MultiLayout other) {
    for (auto& layout : other.layouts_) {
        layouts_.push_back(std::move(layout));
    }
}

bool MultiLayout::serialize(std::ostream& out) const {
    ActionWriter writer(&out);
    writer.writeLine(std::to_string(layouts_.size()));
    if (!writer.ok()) return false;

    // The failing layout's writer has already logged.
    for (const auto& layout : layouts_) {
        if (!layout.serialize(out)) return false;
    }
    return true;
}

}
