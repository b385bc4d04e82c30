#pragma once

/**
 * @file board_constants.h
 * @brief Centralized constants for the board object core.
 *
 * Values are in world units unless noted. The agent-facing schema and the
 * interactive client mirror these; the core re-validates against them.
 */

namespace board {
namespace constants {

// =============================================================================
// Object sizing
// =============================================================================

/// Floor applied to width/height of every non-connector object
constexpr double MIN_OBJECT_SIZE = 24.0;

/// Upper bound for agent-created sticky/shape/text sizes
constexpr double MAX_OBJECT_SIZE = 2000.0;

/// Frames are allowed to be larger than regular objects
constexpr double MIN_FRAME_SIZE = 120.0;
constexpr double MAX_FRAME_SIZE = 4000.0;

/// resizeObject accepts up to this size for any object
constexpr double MAX_RESIZE_SIZE = 4000.0;

constexpr double DEFAULT_STICKY_SIZE = 150.0;
constexpr double DEFAULT_SHAPE_WIDTH = 200.0;
constexpr double DEFAULT_SHAPE_HEIGHT = 120.0;
constexpr double DEFAULT_TEXT_WIDTH = 220.0;
constexpr double DEFAULT_TEXT_HEIGHT = 60.0;
constexpr double DEFAULT_FRAME_WIDTH = 360.0;
constexpr double DEFAULT_FRAME_HEIGHT = 240.0;

// =============================================================================
// Coordinates
// =============================================================================

/// Agent coordinates clamp into [-COORD_LIMIT, COORD_LIMIT]
constexpr double COORD_LIMIT = 100000.0;

// =============================================================================
// Connectors
// =============================================================================

/// World-space radius within which a port accepts a connector endpoint
constexpr double ATTACH_RADIUS = 20.0;

/// Distance tolerance for connector hit tests
constexpr double CONNECTOR_HIT_TOLERANCE = 8.0;

// =============================================================================
// Frames and tables
// =============================================================================

constexpr double FRAME_TITLE_HEIGHT = 32.0;
constexpr double TABLE_TITLE_HEIGHT = 28.0;
constexpr double TABLE_DEFAULT_ROW_HEIGHT = 32.0;
constexpr double TABLE_DEFAULT_COLUMN_WIDTH = 120.0;

// =============================================================================
// Agent layout
// =============================================================================

/// Fixed gap and padding used by deterministic frame layout
constexpr double LAYOUT_GAP = 24.0;
constexpr double LAYOUT_PADDING = 24.0;

/// Placement grid for creates without explicit coordinates
constexpr int PLACEMENT_COLUMNS = 3;
constexpr double PLACEMENT_GAP_X = 230.0;
constexpr double PLACEMENT_GAP_Y = 170.0;

/// Minimum number of new frames before the outer-frame wrap runs
constexpr int OUTER_WRAP_MIN_FRAMES = 4;

// =============================================================================
// Text limits
// =============================================================================

constexpr int MAX_TEXT_LENGTH = 2000;
constexpr int MAX_CONTENT_LENGTH = 4000;
constexpr int MAX_TITLE_LENGTH = 160;
constexpr int MAX_TABLE_TITLE_LENGTH = 200;
constexpr int MAX_CELL_LENGTH = 500;
constexpr int MAX_TABLE_COLUMNS = 20;
constexpr int MAX_TABLE_ROWS = 100;
constexpr int MAX_GRID_IDS = 500;
constexpr int MAX_BATCH_ITEMS = 100;

/// Compact board state truncates long strings to these lengths
constexpr int STATE_TEXT_LENGTH = 160;
constexpr int STATE_TITLE_LENGTH = 80;

// =============================================================================
// History
// =============================================================================

/// Maximum number of undo steps retained
constexpr int UNDO_STACK_CAP = 100;

} // namespace constants
} // namespace board
