/**
 * example_basic.cpp - Building and composing layouts with plume
 *
 * Demonstrates:
 *   - Feeding actions into an ActionBuffer
 *   - Composing finished boxes into a page at absolute positions
 *   - Debug outlines for composed boxes
 *   - Writing the page in compact form and the diagnostic listing
 *
 * Build:
 *   cmake -B build -DPLUME_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_basic
 *
 * Output: page.lay, plus a listing on stdout
 */

#include <plume/plume.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>

using plume::Action;
using plume::Size;
using plume::Size2D;

// Lay out a paragraph of lines in its own frame, one line per 14pt.
static plume::Layout makeParagraph(std::initializer_list<const char*> lines, bool debug) {
    plume::ActionBuffer buffer;
    Size lineHeight = Size::pt(14);
    Size y = Size::pt(12);

    buffer.append(Action::SetFont(0, Size::pt(11)));
    for (const char* line : lines) {
        buffer.append(Action::MoveAbsolute({Size::zero(), y}));
        buffer.append(Action::SetFont(0, Size::pt(11)));
        buffer.append(Action::WriteText(line));
        y += lineHeight;
    }

    auto actions = buffer.finish();
    return plume::Layout::Make({Size::mm(80), y}, *actions, debug);
}

int main() {
    plume::Layout left = makeParagraph({"The quick brown fox", "jumps over the lazy dog."}, true);
    plume::Layout right = makeParagraph({"Pack my box with", "five dozen liquor jugs."}, true);

    plume::ActionBuffer page;
    page.append(Action::MoveAbsolute({Size::mm(20), Size::mm(20)}));
    page.append(Action::SetFont(1, Size::pt(18)));
    page.append(Action::WriteText("Two columns"));

    page.compose({Size::mm(20), Size::mm(35)}, left);
    page.compose({Size::mm(110), Size::mm(35)}, right);

    auto actions = page.finish();

    std::printf("plume %s, %zu actions:\n", plume::version(), actions->size());
    for (const Action& action : *actions) {
        std::printf("  %s\n", plume::describe(action).c_str());
    }

    plume::MultiLayout document;
    document.add(plume::Layout::Make({Size::mm(210), Size::mm(297)}, *actions));

    std::ofstream file("page.lay");
    if (!document.serialize(file)) {
        std::fprintf(stderr, "example_basic: could not write page.lay\n");
        return 1;
    }
    std::printf("Written: page.lay (%zu page)\n", document.count());

    return document.serialize(std::cout) ? 0 : 1;
}
