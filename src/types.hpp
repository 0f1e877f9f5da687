#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums (Damage/Direction).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

// Extent to which the display is out of date. Ordered: a command may only
// raise the level until the next flush.
enum class Damage { Clean = 0, RewriteLine = 1, Rewrite = 2 };

// Argument to the move and delete commands.
enum class Direction { Left = 1, Right, Up, Down, Home, End, PageUp, PageDown, CtrlHome, CtrlEnd };

const char* damage_name(Damage d);
const char* direction_name(Direction d);
