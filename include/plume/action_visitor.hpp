#pragma once

/**
 * @file action_visitor.hpp
 * @brief Visitor interface for traversing layout actions.
 */

#include "plume/types.hpp"
#include <string_view>

namespace plume {

/// @brief Visitor interface for traversing layout actions.
///
/// Implement this interface to consume actions dispatched by
/// Action::accept() or ActionList::accept().
class ActionVisitor {
public:
    virtual ~ActionVisitor() = default;

    /// @brief Visit an absolute move.
    /// @param position Target position.
    virtual void visitMoveAbsolute(Size2D position) = 0;

    /// @brief Visit a font change.
    /// @param index Font table index.
    /// @param size Font size.
    virtual void visitSetFont(u32 index, Size size) = 0;

    /// @brief Visit a text write.
    /// @param text UTF-8 text.
    virtual void visitWriteText(std::string_view text) = 0;

    /// @brief Visit a debug box.
    /// @param position Top-left corner.
    /// @param size Extent of the box.
    virtual void visitDebugBox(Size2D position, Size2D size) = 0;
};

} // namespace plume
