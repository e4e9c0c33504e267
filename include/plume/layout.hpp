#pragma once

/**
 * @file layout.hpp
 * @brief Finished layouts and their serialization.
 */

#include "plume/types.hpp"
#include "plume/action.hpp"
#include <iosfwd>
#include <vector>

namespace plume {

class ActionList;

/// @brief A finished box: its extent plus the actions that draw it.
///
/// Actions are addressed relative to the box's top-left corner. Use
/// ActionBuffer::compose() to place a layout inside a parent.
struct Layout {
    Size2D dimensions;            ///< Bounding size of the box.
    std::vector<Action> actions;  ///< Actions in the box's local frame.
    bool debugRender = false;     ///< Outline the box when composed.

    /// @brief Build a layout from the actions of a finished buffer.
    static Layout Make(Size2D dimensions, const ActionList& actions, bool debugRender = false);

    /// @brief Write the layout in compact form.
    ///
    /// The first line holds the dimensions, the second the number of actions,
    /// followed by one action per line.
    /// @return False if the sink failed.
    bool serialize(std::ostream& out) const;
};

/// @brief An ordered collection of layouts, typically one per page.
class MultiLayout {
public:
    using const_iterator = std::vector<Layout>::const_iterator;

    /// @brief Add a layout at the end.
    void add(Layout layout);

    /// @brief Add all layouts of another collection at the end.
    void extend(MultiLayout other);

    /// @brief Number of layouts.
    size_t count() const { return layouts_.size(); }
    /// @brief Whether no layout has been added.
    bool isEmpty() const { return layouts_.empty(); }

    /// @brief Layout at index @p i, which must be less than count().
    const Layout& operator[](size_t i) const { return layouts_[i]; }
    /// @brief Iterate the layouts in insertion order.
    const_iterator begin() const { return layouts_.begin(); }
    const_iterator end() const { return layouts_.end(); }

    /// @brief Write the layout count on its own line, then every layout.
    /// @return False if the sink failed; output stops at the failing layout.
    bool serialize(std::ostream& out) const;

private:
    std::vector<Layout> layouts_;
};

}
