#include "plume/action.hpp"
#include "plume/action_visitor.hpp"
#include <utility>

namespace plume {

Action Action::MoveAbsolute(Size2D position) {
    Action a(Type::MoveAbsolute);
    a.data_.move.position = position;
    return a;
}

Action Action::SetFont(u32 index, Size size) {
    Action a(Type::SetFont);
    a.data_.font = FontSetting{index, size};
    return a;
}

Action Action::WriteText(std::string text) {
    Action a(Type::WriteText);
    a.text_ = std::move(text);
    return a;
}

Action Action::DebugBox(Size2D position, Size2D size) {
    Action a(Type::DebugBox);
    a.data_.box.position = position;
    a.data_.box.size = size;
    return a;
}

bool Action::isContent() const {
    switch (type_) {
        case Type::MoveAbsolute:
        case Type::SetFont:
        case Type::DebugBox:
            return false;
        case Type::WriteText:
            return true;
    }
    return true;
}

Size2D Action::position() const {
    if (type_ == Type::DebugBox) {
        return data_.box.position;
    }
    return data_.move.position;
}

void Action::accept(ActionVisitor& visitor) const {
    switch (type_) {
        case Type::MoveAbsolute:
            visitor.visitMoveAbsolute(data_.move.position);
            break;
        case Type::SetFont:
            visitor.visitSetFont(data_.font.index, data_.font.size);
            break;
        case Type::WriteText:
            visitor.visitWriteText(text_);
            break;
        case Type::DebugBox:
            visitor.visitDebugBox(data_.box.position, data_.box.size);
            break;
    }
}

bool Action::operator==(const Action& o) const {
    if (type_ != o.type_) return false;

    switch (type_) {
        case Type::MoveAbsolute:
            return data_.move.position == o.data_.move.position;
        case Type::SetFont:
            return data_.font == o.data_.font;
        case Type::WriteText:
            return text_ == o.text_;
        case Type::DebugBox:
            return data_.box.position == o.data_.box.position &&
                   data_.box.size == o.data_.box.size;
    }
    return false;
}

}
