#include "plume/action_buffer.hpp"
#include "plume/action_visitor.hpp"
#include "plume/layout.hpp"
#include "plume/serializer.hpp"
#include <limits>
#include <utility>

namespace plume {

namespace {

// Cannot equal any real font, so the first SetFont is always committed.
constexpr FontSetting kNoFont{std::numeric_limits<u32>::max(), Size::zero()};

}

// --- ActionList ---

ActionList::ActionList(std::vector<Action> actions)
    : actions_(std::move(actions)) {
}

void ActionList::accept(ActionVisitor& visitor) const {
    for (const auto& action : actions_) {
        action.accept(visitor);
    }
}

bool ActionList::serialize(std::ostream& out) const {
    ActionWriter writer(&out);
    accept(writer);
    return writer.ok();
}

// --- ActionBuffer ---

ActionBuffer::ActionBuffer()
    : activeFont_(kNoFont) {
}

void ActionBuffer::reset() {
    committed_.clear();
    origin_ = Size2D::zero();
    activeFont_ = kNoFont;
    hasPendingMove_ = false;
    hasPendingFont_ = false;
}

void ActionBuffer::append(Action action) {
    if (action.isContent()) {
        flushPosition();
        flushFont();
        committed_.push_back(std::move(action));
        return;
    }

    switch (action.type()) {
        case Action::Type::MoveAbsolute:
            pendingMove_ = origin_ + action.position();
            hasPendingMove_ = true;
            break;
        case Action::Type::SetFont:
            pendingFont_ = action.font();
            hasPendingFont_ = true;
            break;
        case Action::Type::DebugBox:
            committed_.push_back(Action::DebugBox(origin_ + action.position(), action.extent()));
            break;
        case Action::Type::WriteText:
            // Content, committed above.
            break;
    }
}

void ActionBuffer::compose(Size2D position, const Layout& layout) {
    flushPosition();

    origin_ = position;
    pendingMove_ = position;
    hasPendingMove_ = true;

    if (layout.debugRender) {
        committed_.push_back(Action::DebugBox(position, layout.dimensions));
    }

    appendAll(layout.actions);
}

std::unique_ptr<ActionList> ActionBuffer::finish() {
    auto list = std::make_unique<ActionList>(std::move(committed_));
    reset();
    return list;
}

void ActionBuffer::flushPosition() {
    if (!hasPendingMove_) return;

    committed_.push_back(Action::MoveAbsolute(pendingMove_));
    hasPendingMove_ = false;
}

void ActionBuffer::flushFont() {
    if (!hasPendingFont_) return;

    hasPendingFont_ = false;
    if (pendingFont_ != activeFont_) {
        committed_.push_back(Action::SetFont(pendingFont_.index, pendingFont_.size));
        activeFont_ = pendingFont_;
    }
}

}
