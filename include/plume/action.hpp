#pragma once

/**
 * @file action.hpp
 * @brief Layout action value type.
 */

#include "plume/types.hpp"
#include <string>
#include <string_view>

namespace plume {

class ActionVisitor;

/// @brief A font selection: index into the document's font table plus size.
struct FontSetting {
    u32 index = 0;  ///< Font table index.
    Size size;      ///< Font size.

    bool operator==(const FontSetting& o) const { return index == o.index && size == o.size; }
    bool operator!=(const FontSetting& o) const { return !(*this == o); }
};

/// @brief A single layouting instruction.
///
/// Actions are immutable values. Positions are absolute within whatever
/// coordinate frame the producer of the action works in; ActionBuffer
/// translates them when a layout is composed into a parent.
class Action {
public:
    /// @brief Action type enumeration.
    enum class Type : u8 {
        MoveAbsolute,  ///< Move to an absolute position.
        SetFont,       ///< Select a font by index and size.
        WriteText,     ///< Write text at the current position.
        DebugBox       ///< Outline a box for debugging.
    };

    /// @brief Move to an absolute position.
    static Action MoveAbsolute(Size2D position);

    /// @brief Select the font with the given table index and size.
    static Action SetFont(u32 index, Size size);

    /// @brief Write text starting at the current position.
    /// @param text UTF-8 text, emitted verbatim.
    static Action WriteText(std::string text);

    /// @brief Visualize a box for debugging purposes.
    /// @param position Top-left corner.
    /// @param size Extent of the box.
    static Action DebugBox(Size2D position, Size2D size);

    /// @brief Which variant this action is.
    Type type() const { return type_; }

    /// @brief Whether this action emits visible content.
    ///
    /// Content actions force pending position and font changes to be
    /// committed before them.
    bool isContent() const;

    /// @brief Target of a MoveAbsolute, or top-left corner of a DebugBox.
    Size2D position() const;

    /// @brief Extent of a DebugBox.
    Size2D extent() const { return data_.box.size; }

    /// @brief Font of a SetFont.
    FontSetting font() const { return data_.font; }

    /// @brief Payload of a WriteText.
    const std::string& text() const { return text_; }

    /// @brief Dispatch this action to the matching visitor method.
    void accept(ActionVisitor& visitor) const;

    bool operator==(const Action& o) const;
    bool operator!=(const Action& o) const { return !(*this == o); }

private:
    explicit Action(Type type) : type_(type) {}

    Type type_;

    /// @brief Per-type payload; WriteText keeps its text in text_.
    union Data {
        struct { Size2D position; } move;               ///< MoveAbsolute data.
        FontSetting font;                               ///< SetFont data.
        struct { Size2D position; Size2D size; } box;   ///< DebugBox data.

        Data() : move{} {}
    } data_;

    std::string text_;
};

}
