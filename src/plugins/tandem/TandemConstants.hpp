#pragma once

namespace Tandem::Constants {

// Gesture thresholds are screen-space pixels.
inline constexpr double kDragThresholdPx = 6.0;
inline constexpr double kInteractiveDragThresholdFactor = 2.0;

inline constexpr int kSuppressBackgroundClearMs = 150;

inline constexpr double kShapeMinSize = 20.0;
inline constexpr double kShapeMaxSize = 1200.0;
inline constexpr double kShapeDefaultSize = 120.0;

inline constexpr double kTextMinWidth = 120.0;
inline constexpr double kTextMaxWidth = 1600.0;
inline constexpr double kTextDefaultWidth = 320.0;
inline constexpr double kTextDefaultFontSize = 18.0;

inline constexpr double kResizeMinRatio = 0.1;
inline constexpr double kMinVectorLength = 1e-6;

inline constexpr double kMinZoom = 0.10;
inline constexpr double kMaxZoom = 8.00;

// Group grid view.
inline constexpr int kGridColumns = 3;
inline constexpr double kGridPadding = 40.0;
inline constexpr double kGridCellWidth = 200.0;
inline constexpr double kGridCellHeight = 150.0;
inline constexpr double kGridGapX = 20.0;
inline constexpr double kGridGapY = 40.0;

// Group outline.
inline constexpr double kGroupOutlinePadding = 32.0;
inline constexpr double kEmptyGroupSize = 100.0;
inline constexpr double kUnmeasuredChildExtent = 100.0;

inline constexpr char kDragTopic[] = "drag";
inline constexpr char kResizeTopic[] = "resize";
inline constexpr char kSelectionTopic[] = "selection";

} // namespace Tandem::Constants
