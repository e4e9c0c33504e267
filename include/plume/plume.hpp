#pragma once

/**
 * plume - Layout action buffering and serialization
 *
 * Usage:
 *
 *   #include <plume/plume.hpp>
 *   plume::ActionBuffer buffer;
 *   buffer.append(plume::Action::MoveAbsolute({plume::Size::pt(10), plume::Size::pt(10)}));
 *   buffer.append(plume::Action::SetFont(0, plume::Size::pt(12)));
 *   buffer.append(plume::Action::WriteText("hello"));
 *   auto actions = buffer.finish();
 *   actions->serialize(std::cout);
 */

// Version
#include "plume/version.hpp"

// Core types
#include "plume/types.hpp"

// Actions
#include "plume/action.hpp"
#include "plume/action_visitor.hpp"

// Buffering and composition
#include "plume/action_buffer.hpp"
#include "plume/layout.hpp"

// Text forms
#include "plume/serializer.hpp"
