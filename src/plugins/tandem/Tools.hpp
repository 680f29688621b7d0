#pragma once

#include "tandem/TandemGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

#include <optional>

namespace Tandem::Tools {

// -----------------------------------------------------------------------------
// Coordinate transform: screen <-> canvas space
// -----------------------------------------------------------------------------
namespace Math {

TANDEM_EXPORT double clampZoom(double z);

// (screen - origin.topLeft - pan) / zoom. A missing origin element maps to a
// zero-origin rectangle so gestures keep working in degraded layouts.
TANDEM_EXPORT QPointF toCanvas(const QPointF& screenPos,
							   const QPointF& pan,
							   double zoom,
							   const std::optional<QRectF>& originBounds = std::nullopt);

TANDEM_EXPORT QPointF fromCanvas(const QPointF& canvasPos,
								 const QPointF& pan,
								 double zoom,
								 const std::optional<QRectF>& originBounds = std::nullopt);

TANDEM_EXPORT double normalizeDegrees(double degrees);

// atan2 from center to pointer, +90 so that 0 points visually up.
TANDEM_EXPORT double rotationFromCenter(const QPointF& center, const QPointF& pointer);

// Projection of `current` onto `initial` divided by |initial|, floored at
// minRatio. Degenerate initial vectors yield 1.0.
TANDEM_EXPORT double projectedRatio(const QPointF& initial, const QPointF& current, double minRatio);

TANDEM_EXPORT double vectorLength(const QPointF& v);

} // namespace Math

} // namespace Tandem::Tools
