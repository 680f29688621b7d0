#include "tandem/Tools.hpp"
#include "tandem/TandemConstants.hpp"

#include <QtCore/QtMath>

#include <algorithm>
#include <cmath>

namespace Tandem::Tools::Math {

namespace {

double safeZoom(double zoom)
{
	if (!std::isfinite(zoom) || zoom <= 0.0)
		return 1.0;
	return zoom;
}

QPointF originOf(const std::optional<QRectF>& originBounds)
{
	return originBounds ? originBounds->topLeft() : QPointF(0.0, 0.0);
}

} // namespace

double clampZoom(double z)
{
	return std::clamp(z, Constants::kMinZoom, Constants::kMaxZoom);
}

QPointF toCanvas(const QPointF& screenPos,
				 const QPointF& pan,
				 double zoom,
				 const std::optional<QRectF>& originBounds)
{
	const QPointF local = screenPos - originOf(originBounds);
	return (local - pan) / safeZoom(zoom);
}

QPointF fromCanvas(const QPointF& canvasPos,
				   const QPointF& pan,
				   double zoom,
				   const std::optional<QRectF>& originBounds)
{
	return canvasPos * safeZoom(zoom) + pan + originOf(originBounds);
}

double normalizeDegrees(double degrees)
{
	if (!std::isfinite(degrees))
		return 0.0;
	double normalized = std::fmod(degrees, 360.0);
	if (normalized < 0.0)
		normalized += 360.0;
	// fmod of a tiny negative value can round up to exactly 360.
	if (normalized >= 360.0)
		normalized = 0.0;
	return normalized;
}

double rotationFromCenter(const QPointF& center, const QPointF& pointer)
{
	const QPointF d = pointer - center;
	const double degrees = qRadiansToDegrees(std::atan2(d.y(), d.x())) + 90.0;
	return normalizeDegrees(degrees);
}

double vectorLength(const QPointF& v)
{
	return std::hypot(v.x(), v.y());
}

double projectedRatio(const QPointF& initial, const QPointF& current, double minRatio)
{
	const double initialLength = vectorLength(initial);
	if (initialLength < Constants::kMinVectorLength)
		return 1.0;

	const double dot = QPointF::dotProduct(current, initial);
	const double projection = dot / initialLength;
	return std::max(minRatio, projection / initialLength);
}

} // namespace Tandem::Tools::Math
