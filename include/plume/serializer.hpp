#pragma once

/**
 * @file serializer.hpp
 * @brief Compact and diagnostic text forms of layout actions.
 *
 * The compact form is the interchange format consumed by renderers:
 *
 *   m <x> <y>          absolute move
 *   f <index> <size>   set font
 *   w <text>           write text (raw, unescaped)
 *   b <x> <y> <w> <h>  debug box
 *
 * Positions and box extents are in points with four decimals. The font size
 * is in points, printed in its shortest exact form.
 */

#include "plume/action.hpp"
#include "plume/action_visitor.hpp"
#include <iosfwd>
#include <string>

namespace plume {

/// @brief Compact form of an action, without a line terminator.
std::string encode(const Action& action);

/// @brief Human-readable form of an action, e.g. `move 10pt 20pt`.
///
/// Intended for logs and test output; not meant to be parsed back.
std::string describe(const Action& action);

/// @brief Write the compact form of a single action to a sink.
///
/// The action is formatted completely and handed to the sink in a single
/// write. A sink that is already failed receives nothing. A sink that accepts
/// only part of the write may keep that prefix; the call still returns false.
/// @param action The action to write.
/// @param out Output sink.
/// @return False if the sink failed.
bool serialize(const Action& action, std::ostream& out);

/// @brief Visitor that writes each visited action to a sink, one per line.
///
/// After the first failed write the writer ignores further actions and ok()
/// returns false.
class ActionWriter : public ActionVisitor {
public:
    explicit ActionWriter(std::ostream* out);

    void visitMoveAbsolute(Size2D position) override;
    void visitSetFont(u32 index, Size size) override;
    void visitWriteText(std::string_view text) override;
    void visitDebugBox(Size2D position, Size2D size) override;

    /// @brief Write a raw line (used for layout headers).
    void writeLine(std::string_view line);

    /// @brief Whether every write so far succeeded.
    bool ok() const { return ok_; }

    /// @brief Number of lines written successfully.
    u32 linesWritten() const { return lines_; }

private:
    std::ostream* out_;
    bool ok_ = true;
    u32 lines_ = 0;
};

}
