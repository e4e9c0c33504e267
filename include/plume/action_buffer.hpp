#pragma once

/**
 * @file action_buffer.hpp
 * @brief Optimizing action buffer and the immutable action list it produces.
 */

#include "plume/types.hpp"
#include "plume/action.hpp"
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <vector>

namespace plume {

class ActionVisitor;
struct Layout;

/// @brief Immutable, ordered sequence of committed layout actions.
///
/// Created by ActionBuffer::finish().
class ActionList {
public:
    using const_iterator = std::vector<Action>::const_iterator;

    /// @brief Construct a list taking ownership of the given actions.
    explicit ActionList(std::vector<Action> actions);

    /// @brief Get the committed actions in order.
    const std::vector<Action>& actions() const { return actions_; }
    /// @brief Number of committed actions.
    size_t size() const { return actions_.size(); }
    /// @brief Whether the list holds no actions.
    bool empty() const { return actions_.empty(); }

    /// @brief Iterate the actions in commit order.
    const_iterator begin() const { return actions_.begin(); }
    const_iterator end() const { return actions_.end(); }

    /// @brief Traverse actions in committed order.
    /// @param visitor The visitor to receive each action.
    void accept(ActionVisitor& visitor) const;

    /// @brief Write every action in compact form, one per line.
    /// @param out Output sink.
    /// @return False if the sink failed; output stops at the failing action.
    bool serialize(std::ostream& out) const;

private:
    std::vector<Action> actions_;
};

/// @brief Accumulates layout actions and optimizes them as they are added.
///
/// Moves and font changes are cached and only committed when content is
/// written, so a run of moves collapses into the last one and a font that is
/// already active is never set again. Debug boxes are committed immediately
/// and leave the cached state alone.
///
/// All moves are translated by the current origin. compose() sets the origin
/// to the position of the composed layout, which re-anchors the layout's
/// locally-addressed actions in this buffer's frame. There is one origin,
/// not a stack: it stays in effect until the next compose() or reset().
class ActionBuffer {
public:
    ActionBuffer();

    /// @brief Reset the buffer, discarding committed and pending actions.
    void reset();

    /// @brief Add an action.
    void append(Action action);

    /// @brief Add a series of actions in order.
    /// @param actions Any range of Action (vector, ActionList, ...).
    template <typename Range>
    void appendAll(const Range& actions) {
        for (const Action& action : actions) {
            append(action);
        }
    }

    /// @copydoc appendAll(const Range&)
    void appendAll(std::initializer_list<Action> actions) {
        for (const Action& action : actions) {
            append(action);
        }
    }

    /// @brief Add a finished layout at a position.
    ///
    /// Any pending move from before the call is committed first, in the old
    /// frame. All move actions inside the layout are then translated by the
    /// position.
    /// @param position Absolute position of the layout's top-left corner.
    /// @param layout The layout to add.
    void compose(Size2D position, const Layout& layout);

    /// @brief Whether no actions have been committed. Pending moves and font
    ///        changes do not count.
    bool isEmpty() const { return committed_.empty(); }

    /// @brief Number of committed actions.
    size_t size() const { return committed_.size(); }

    /// @brief The translation applied to positions added from now on.
    Size2D origin() const { return origin_; }

    /// @brief Finish and produce the immutable list of committed actions.
    ///
    /// Pending moves and font changes that no content followed are dropped.
    /// The buffer is left in its initial state.
    /// @return Unique pointer to the completed ActionList.
    std::unique_ptr<ActionList> finish();

private:
    void flushPosition();
    void flushFont();

    std::vector<Action> committed_;
    Size2D origin_;
    FontSetting activeFont_;

    bool hasPendingMove_ = false;
    Size2D pendingMove_;
    bool hasPendingFont_ = false;
    FontSetting pendingFont_;
};

}
